#pragma once

#include "chunk.handler.hh"
#include "storage.client.hh"

#include <memory>
#include <string>
#include <string_view>

namespace s3stream {
/**
 * @brief A ChunkHandler that uploads its chunks as the parts of one multipart
 * upload.
 * @details open() starts the multipart upload; subclasses decide how parts
 * are uploaded and how the upload is completed.
 */
class MultipartUploader : public ChunkHandler
{
  public:
    MultipartUploader(std::shared_ptr<StorageClient> client,
                      std::string_view bucket_name,
                      std::string_view object_key,
                      Headers headers);

    void open() override;

    const std::string& bucket_name() const noexcept { return bucket_name_; }
    const std::string& object_key() const noexcept { return object_key_; }

    /// Empty until open() has been called.
    const std::string& upload_id() const noexcept { return upload_id_; }

  protected:
    std::shared_ptr<StorageClient> client_;
    std::string bucket_name_;
    std::string object_key_;
    Headers headers_;

    std::string upload_id_;

    /// Throws if open() has not been called.
    void check_started_() const;
};
} // namespace s3stream
