#include "serial.uploader.hh"

s3stream::SerialUploader::SerialUploader(std::shared_ptr<StorageClient> client,
                                         std::string_view bucket_name,
                                         std::string_view object_key,
                                         Headers headers)
  : MultipartUploader(std::move(client),
                      bucket_name,
                      object_key,
                      std::move(headers))
{
}

std::optional<s3stream::ChunkBuffer>
s3stream::SerialUploader::write(ChunkBuffer&& chunk)
{
    check_started_();

    // S3 counts parts from 1
    const auto part_number = static_cast<unsigned int>(parts_.size()) + 1;
    parts_.push_back(client_->upload_part(
      bucket_name_, object_key_, upload_id_, part_number, chunk));

    // the upload has finished, so the buffer can be reused right away
    return std::move(chunk);
}

void
s3stream::SerialUploader::close()
{
    check_started_();

    client_->complete_multipart_upload(
      bucket_name_, object_key_, upload_id_, parts_);
}
