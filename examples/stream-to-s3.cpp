/// @file stream-to-s3.cpp
/// @brief Example of streaming a file (or stdin) of unknown size to S3.
/// @details Reads the destination from the environment:
/// - S3STREAM_S3_ENDPOINT ("http://...") - the URI of the S3 server
/// - S3STREAM_S3_BUCKET_NAME - the name of the bucket
/// - S3STREAM_S3_ACCESS_KEY_ID - the access key ID for the S3 server
/// - S3STREAM_S3_SECRET_ACCESS_KEY - the secret access key for the S3 server
/// - S3STREAM_S3_REGION (optional)
///
/// Usage: stream-to-s3 <object-key> [file]

#include "errors.hh"
#include "logger.hh"
#include "s3.client.hh"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>

namespace {
std::string
require_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        throw s3stream::ConfigurationError(LOG_ERROR(name, " not set."));
    }
    return value;
}

void
copy_to(std::istream& in, s3stream::ChunkedStream& out)
{
    std::vector<char> buffer(1 << 16);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (const auto n = in.gcount(); n > 0) {
            out.write({ reinterpret_cast<const std::byte*>(buffer.data()),
                        static_cast<size_t>(n) });
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read input");
    }
}
} // namespace

int
main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <object-key> [file]\n";
        return 1;
    }
    const std::string object_key = argv[1];

    try {
        const char* region = std::getenv("S3STREAM_S3_REGION");
        auto client =
          std::make_shared<s3stream::S3Client>(s3stream::S3ClientSettings{
            .endpoint = require_env("S3STREAM_S3_ENDPOINT"),
            .region = region ? region : "",
            .credentials = { require_env("S3STREAM_S3_ACCESS_KEY_ID"),
                             require_env("S3STREAM_S3_SECRET_ACCESS_KEY"),
                             "" },
          });
        const auto bucket_name = require_env("S3STREAM_S3_BUCKET_NAME");

        std::ifstream file;
        if (argc > 2) {
            file.open(argv[2], std::ios::binary);
            if (!file) {
                LOG_ERROR("Failed to open ", argv[2]);
                return 1;
            }
        }
        std::istream& in = argc > 2 ? file : std::cin;

        size_t bytes_uploaded = 0;
        client->stream_upload(
          bucket_name,
          object_key,
          [&](s3stream::ChunkedStream& stream) {
              copy_to(in, stream);
              bytes_uploaded = stream.bytes_written();
          },
          { .headers = { { "Content-Type", "application/octet-stream" } } });

        LOG_INFO("Uploaded ",
                 bytes_uploaded,
                 " bytes to ",
                 bucket_name,
                 "/",
                 object_key);
    } catch (const std::exception& e) {
        LOG_ERROR("Upload failed: ", e.what());
        return 1;
    }

    return 0;
}
