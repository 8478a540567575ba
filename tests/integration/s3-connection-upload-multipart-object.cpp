#include "s3.connection.hh"
#include "test.s3.hh"

#include <span>

int
main()
{
    TestS3Settings s3;
    if (!s3.from_environment()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;
    const std::string object_name = TEST;

    try {
        s3stream::RequestSigner signer(
          { s3.access_key_id, s3.secret_access_key, "" }, s3.region);
        s3stream::S3Connection conn(s3.endpoint, signer);

        if (!conn.check_connection()) {
            LOG_ERROR("Failed to connect to S3.");
            return 1;
        }
        CHECK(conn.bucket_exists(s3.bucket_name));
        CHECK(conn.delete_object(s3.bucket_name, object_name));
        CHECK(!conn.object_exists(s3.bucket_name, object_name));

        std::string upload_id =
          conn.create_multipart_object(s3.bucket_name, object_name, {});
        CHECK(!upload_id.empty());

        std::vector<s3stream::Part> parts;

        // parts need to be at least 5MiB, except the last part
        std::vector<std::byte> data(5 << 20, std::byte{ 0 });
        for (auto i = 0u; i < 4; ++i) {
            auto part = conn.upload_multipart_object_part(
              s3.bucket_name, object_name, upload_id, data, i + 1);
            CHECK(!part.etag.empty());
            EXPECT_EQ(unsigned int, part.number, i + 1);

            parts.push_back(part);
        }

        // last part is 1MiB
        {
            const unsigned int part_number = parts.size() + 1;
            auto part = conn.upload_multipart_object_part(
              s3.bucket_name,
              object_name,
              upload_id,
              std::span<const std::byte>(data.data(), 1 << 20),
              part_number);
            CHECK(!part.etag.empty());

            parts.push_back(part);
        }

        auto completed = conn.complete_multipart_object(
          s3.bucket_name, object_name, upload_id, parts);
        CHECK(completed.key == object_name);

        CHECK(conn.object_exists(s3.bucket_name, object_name));
        EXPECT_EQ(size_t,
                  TestS3Inspector(s3).object_size(object_name),
                  4 * (5 << 20) + (1 << 20));

        // an aborted upload leaves nothing behind
        CHECK(conn.delete_object(s3.bucket_name, object_name));
        upload_id =
          conn.create_multipart_object(s3.bucket_name, object_name, {});
        conn.upload_multipart_object_part(
          s3.bucket_name, object_name, upload_id, data, 1);
        CHECK(conn.abort_multipart_object(
          s3.bucket_name, object_name, upload_id));
        CHECK(!conn.object_exists(s3.bucket_name, object_name));

        conn.close();
        CHECK(conn.is_closed());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed: ", e.what());
    }

    return retval;
}
