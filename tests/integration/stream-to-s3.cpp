#include "s3stream.h"
#include "test.s3.hh"

#include <algorithm>
#include <string>

namespace {
constexpr size_t MiB = 1 << 20;

/// 12 MiB and a bit: two full 5 MiB parts and a short last one.
std::string
make_payload()
{
    std::string payload(12 * MiB + 3, '\0');
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>('a' + i % 26);
    }
    return payload;
}

void
stream_object(const TestS3Settings& s3,
              const std::string& object_key,
              const std::string& payload,
              bool serial)
{
    S3StreamSettings settings{};
    settings.endpoint = s3.endpoint.c_str();
    settings.bucket_name = s3.bucket_name.c_str();
    settings.object_key = object_key.c_str();
    settings.access_key_id = s3.access_key_id.c_str();
    settings.secret_access_key = s3.secret_access_key.c_str();
    settings.region = s3.region.c_str();
    settings.custom_headers = R"({"Content-Type": "text/plain"})";
    settings.max_workers = 2;
    settings.serial = serial;

    S3Stream* stream = S3Stream_create(&settings);
    CHECK(stream);

    try {
        // append in uneven pieces
        const size_t piece = 3 * MiB + 11;
        for (size_t offset = 0; offset < payload.size(); offset += piece) {
            const size_t n = std::min(piece, payload.size() - offset);
            size_t bytes_out = 0;
            CHECK_OK(
              S3Stream_append(stream, payload.data() + offset, n, &bytes_out));
            EXPECT_EQ(size_t, bytes_out, n);
        }

        CHECK_OK(S3Stream_close(stream));

        // a closed stream takes no more data
        size_t bytes_out = 0;
        EXPECT_EQ(int,
                  S3Stream_append(stream, "x", 1, &bytes_out),
                  S3StreamStatusCode_StreamClosed);

        // closing twice is fine
        CHECK_OK(S3Stream_close(stream));
    } catch (...) {
        S3Stream_destroy(stream);
        throw;
    }

    S3Stream_destroy(stream);
}
} // namespace

int
main()
{
    TestS3Settings s3;
    if (!s3.from_environment()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;
    const std::string object_key = TEST;

    try {
        TestS3Inspector inspector(s3);
        const auto payload = make_payload();

        for (bool serial : { false, true }) {
            inspector.remove_object(object_key);
            CHECK(!inspector.object_exists(object_key));

            stream_object(s3, object_key, payload, serial);

            CHECK(inspector.object_exists(object_key));
            EXPECT_EQ(size_t, inspector.object_size(object_key), payload.size());
            CHECK(inspector.object_contents(object_key) == payload);
            CHECK(inspector.object_header(object_key, "Content-Type") ==
                  "text/plain");
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed: ", e.what());
    }

    try {
        TestS3Inspector(s3).remove_object(object_key);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to clean up: ", e.what());
    }

    return retval;
}
