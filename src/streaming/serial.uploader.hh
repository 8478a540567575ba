#pragma once

#include "multipart.uploader.hh"

#include <vector>

namespace s3stream {
/**
 * @brief Uploads each chunk as one part, synchronously, on the writing
 * thread.
 * @details Slower than PipelinedUploader, but blocking, with minimal memory
 * overhead, and simple to debug. Any failure propagates out of the call that
 * caused it.
 */
class SerialUploader : public MultipartUploader
{
  public:
    SerialUploader(std::shared_ptr<StorageClient> client,
                   std::string_view bucket_name,
                   std::string_view object_key,
                   Headers headers = {});

    std::optional<ChunkBuffer> write(ChunkBuffer&& chunk) override;
    void close() override;

    const std::vector<Part>& parts() const noexcept { return parts_; }

  private:
    std::vector<Part> parts_;
};
} // namespace s3stream
