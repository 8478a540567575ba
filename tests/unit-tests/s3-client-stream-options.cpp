#include "errors.hh"
#include "s3.client.hh"
#include "unit.test.macros.hh"

namespace {
std::shared_ptr<s3stream::S3Client>
make_client()
{
    // no request is made, so nothing needs to listen here
    return std::make_shared<s3stream::S3Client>(s3stream::S3ClientSettings{
      .endpoint = "http://localhost:9000",
      .credentials = { "key-id", "secret", "" },
      .lazy_init = true,
    });
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        EXPECT_THROWS(s3stream::ConfigurationError,
                      s3stream::S3Client(s3stream::S3ClientSettings{
                        .credentials = { "key-id", "secret", "" } }));
        EXPECT_THROWS(s3stream::ConfigurationError,
                      s3stream::S3Client(s3stream::S3ClientSettings{
                        .endpoint = "http://localhost:9000",
                        .lazy_init = true }));

        auto client = make_client();

        EXPECT_THROWS(
          s3stream::ConfigurationError,
          client->stream_upload("bucket",
                                "object",
                                { .part_size = (5 << 20) - 1 }));
        EXPECT_THROWS(
          s3stream::ConfigurationError,
          client->stream_upload("bucket", "object", { .max_workers = 0 }));
        EXPECT_THROWS(s3stream::ConfigurationError,
                      client->stream_upload(
                        "bucket",
                        "object",
                        { .max_workers =
                            s3stream::S3Client::maximum_workers + 1 }));
        EXPECT_THROWS(s3stream::ConfigurationError,
                      client->stream_upload("", "object"));

        // a valid stream talks to nobody until its first part is full
        {
            auto stream = client->stream_upload("bucket", "object");
            EXPECT_EQ(size_t, stream->chunk_size(), 5 << 20);

            const std::vector<std::byte> data(1024, std::byte{ 0 });
            stream->write(data);
            EXPECT_EQ(size_t, stream->bytes_written(), 1024);
            EXPECT_EQ(size_t, stream->chunks_dispatched(), 0);
        }

        // an error in the callback is rethrown; nothing was uploaded, so
        // there is nothing to abort
        bool rethrown = false;
        try {
            client->stream_upload(
              "bucket",
              "object",
              [](s3stream::ChunkedStream& stream) {
                  const std::vector<std::byte> data(16, std::byte{ 1 });
                  stream.write(data);
                  throw std::runtime_error("producer failed");
              },
              { .pipelined = false });
        } catch (const std::runtime_error& exc) {
            rethrown = std::string(exc.what()) == "producer failed";
        }
        CHECK(rethrown);

        client->close();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
