#include "macros.hh"
#include "s3.client.hh"
#include "errors.hh"
#include "pipelined.uploader.hh"
#include "serial.uploader.hh"

std::unique_ptr<s3stream::MultipartUploader>
s3stream::make_uploader(std::shared_ptr<StorageClient> client,
                        std::string_view bucket_name,
                        std::string_view object_key,
                        const StreamUploadOptions& options)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_key);
    EXPECT_SETTING(options.part_size >= S3Client::minimum_part_size,
                   "S3 enforces a minimum part size of ",
                   S3Client::minimum_part_size,
                   " bytes (got: ",
                   options.part_size,
                   ")");
    EXPECT_SETTING(options.max_workers > 0,
                   "max_workers must be greater than zero");
    EXPECT_SETTING(options.max_workers <= S3Client::maximum_workers,
                   "max_workers must be at most ",
                   S3Client::maximum_workers,
                   " (got: ",
                   options.max_workers,
                   ")");

    if (options.pipelined) {
        return std::make_unique<PipelinedUploader>(std::move(client),
                                                   bucket_name,
                                                   object_key,
                                                   options.headers,
                                                   options.max_workers);
    }

    return std::make_unique<SerialUploader>(
      std::move(client), bucket_name, object_key, options.headers);
}

s3stream::S3Client::S3Client(S3ClientSettings settings)
  : session_{ std::move(settings) }
{
}

s3stream::S3Client::~S3Client() noexcept
{
    close();
}

std::string
s3stream::S3Client::start_multipart_upload(std::string_view bucket_name,
                                           std::string_view object_key,
                                           const Headers& headers)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.create_multipart_object(bucket_name, object_key, headers);
    });
}

s3stream::Part
s3stream::S3Client::upload_part(std::string_view bucket_name,
                                std::string_view object_key,
                                std::string_view upload_id,
                                unsigned int part_number,
                                std::span<const std::byte> data)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.upload_multipart_object_part(
          bucket_name, object_key, upload_id, data, part_number);
    });
}

s3stream::CompletedUpload
s3stream::S3Client::complete_multipart_upload(std::string_view bucket_name,
                                              std::string_view object_key,
                                              std::string_view upload_id,
                                              const std::vector<Part>& parts)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.complete_multipart_object(
          bucket_name, object_key, upload_id, parts);
    });
}

bool
s3stream::S3Client::abort_multipart_upload(std::string_view bucket_name,
                                           std::string_view object_key,
                                           std::string_view upload_id)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.abort_multipart_object(bucket_name, object_key, upload_id);
    });
}

bool
s3stream::S3Client::bucket_exists(std::string_view bucket_name)
{
    return session_.with_connection(
      [&](S3Connection& conn) { return conn.bucket_exists(bucket_name); });
}

bool
s3stream::S3Client::object_exists(std::string_view bucket_name,
                                  std::string_view object_key)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.object_exists(bucket_name, object_key);
    });
}

bool
s3stream::S3Client::delete_object(std::string_view bucket_name,
                                  std::string_view object_key)
{
    return session_.with_connection([&](S3Connection& conn) {
        return conn.delete_object(bucket_name, object_key);
    });
}

std::unique_ptr<s3stream::MultipartUploader>
s3stream::S3Client::make_uploader(std::string_view bucket_name,
                                  std::string_view object_key,
                                  const StreamUploadOptions& options)
{
    return s3stream::make_uploader(
      shared_from_this(), bucket_name, object_key, options);
}

std::unique_ptr<s3stream::ChunkedStream>
s3stream::S3Client::stream_upload(std::string_view bucket_name,
                                  std::string_view object_key,
                                  const StreamUploadOptions& options)
{
    return std::make_unique<ChunkedStream>(
      options.part_size, make_uploader(bucket_name, object_key, options));
}

void
s3stream::S3Client::stream_upload(
  std::string_view bucket_name,
  std::string_view object_key,
  const std::function<void(ChunkedStream&)>& callback,
  const StreamUploadOptions& options)
{
    auto uploader = make_uploader(bucket_name, object_key, options);
    const MultipartUploader* handle = uploader.get();

    auto stream =
      std::make_unique<ChunkedStream>(options.part_size, std::move(uploader));

    try {
        callback(*stream);
        stream->close();
    } catch (const std::exception& exc) {
        const std::string upload_id = handle->upload_id();

        // waits for the parts still in flight
        stream.reset();

        if (!upload_id.empty()) {
            LOG_WARNING("Aborting upload of object ",
                        object_key,
                        ": ",
                        exc.what());
            abort_quietly_(bucket_name, object_key, upload_id);
        }
        throw;
    }
}

void
s3stream::S3Client::close()
{
    session_.close();
}

void
s3stream::S3Client::abort_quietly_(std::string_view bucket_name,
                                   std::string_view object_key,
                                   std::string_view upload_id) noexcept
{
    try {
        if (!abort_multipart_upload(bucket_name, object_key, upload_id)) {
            LOG_ERROR("Failed to abort multipart upload ", upload_id);
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Failed to abort multipart upload ",
                  upload_id,
                  ": ",
                  exc.what());
    }
}
