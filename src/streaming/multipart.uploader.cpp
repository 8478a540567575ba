#include "macros.hh"
#include "multipart.uploader.hh"

s3stream::MultipartUploader::MultipartUploader(
  std::shared_ptr<StorageClient> client,
  std::string_view bucket_name,
  std::string_view object_key,
  Headers headers)
  : client_{ std::move(client) }
  , bucket_name_{ bucket_name }
  , object_key_{ object_key }
  , headers_{ std::move(headers) }
{
    EXPECT(client_, "Null pointer: client");
    EXPECT_OBJECT_TARGET(bucket_name_, object_key_);
}

void
s3stream::MultipartUploader::open()
{
    EXPECT(upload_id_.empty(),
           "Multipart upload of object ",
           object_key_,
           " was already started");

    upload_id_ =
      client_->start_multipart_upload(bucket_name_, object_key_, headers_);
    EXPECT(!upload_id_.empty(), "Upload id returned empty.");

    LOG_DEBUG("Started multipart upload ",
              upload_id_,
              " of object ",
              object_key_,
              " in bucket ",
              bucket_name_);
}

void
s3stream::MultipartUploader::check_started_() const
{
    EXPECT(!upload_id_.empty(), "Multipart upload has not been started");
}
