#pragma once

#include "chunked.stream.hh"
#include "connection.session.hh"
#include "multipart.uploader.hh"
#include "s3.connection.hh"
#include "storage.client.hh"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace s3stream {
using S3ClientSettings = SessionSettings;

struct StreamUploadOptions
{
    size_t part_size{ 5 << 20 };
    unsigned int max_workers{ 8 };
    Headers headers;

    /// Upload parts concurrently; otherwise one at a time on the writing
    /// thread.
    bool pipelined{ true };
};

/**
 * @brief Make the uploader for a multipart upload to
 * @p bucket_name/@p object_key through @p client.
 * @throws ConfigurationError if the bucket or key is empty, the part size is
 * below the S3 minimum, or max_workers is zero or above its limit.
 */
std::unique_ptr<MultipartUploader>
make_uploader(std::shared_ptr<StorageClient> client,
              std::string_view bucket_name,
              std::string_view object_key,
              const StreamUploadOptions& options);

/**
 * @brief A thread-safe S3 client for streaming uploads.
 * @details Requests are sent over connections from a pool that is renewed
 * periodically. A request that fails because the credentials expired is
 * retried once with fresh credentials and a fresh pool.
 * @note Must be owned by a std::shared_ptr, since streams keep the client
 * alive.
 */
class S3Client
  : public StorageClient
  , public std::enable_shared_from_this<S3Client>
{
  public:
    /// S3 rejects smaller parts, except for the last part of an upload.
    static constexpr size_t minimum_part_size = 5 << 20;

    /// Each worker is a thread with its own connection.
    static constexpr unsigned int maximum_workers = 256;

    explicit S3Client(S3ClientSettings settings);
    ~S3Client() noexcept override;

    std::string start_multipart_upload(std::string_view bucket_name,
                                       std::string_view object_key,
                                       const Headers& headers) override;
    Part upload_part(std::string_view bucket_name,
                     std::string_view object_key,
                     std::string_view upload_id,
                     unsigned int part_number,
                     std::span<const std::byte> data) override;
    CompletedUpload complete_multipart_upload(
      std::string_view bucket_name,
      std::string_view object_key,
      std::string_view upload_id,
      const std::vector<Part>& parts) override;
    bool abort_multipart_upload(std::string_view bucket_name,
                                std::string_view object_key,
                                std::string_view upload_id) override;

    bool bucket_exists(std::string_view bucket_name);
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_key);
    bool delete_object(std::string_view bucket_name,
                       std::string_view object_key);

    /**
     * @brief Make an uploader for a multipart upload to
     * @p bucket_name/@p object_key, as configured by @p options.
     * @throws ConfigurationError if @p options are invalid.
     */
    std::unique_ptr<MultipartUploader> make_uploader(
      std::string_view bucket_name,
      std::string_view object_key,
      const StreamUploadOptions& options = {});

    /**
     * @brief Open a stream that uploads everything written to it to
     * @p bucket_name/@p object_key. The size of the object need not be known
     * in advance.
     * @details The object is created when the stream is closed. Closing a
     * stream that received no data creates an empty object.
     * @throws ConfigurationError if the part size is below
     * minimum_part_size or max_workers is not in 1..maximum_workers.
     */
    std::unique_ptr<ChunkedStream> stream_upload(
      std::string_view bucket_name,
      std::string_view object_key,
      const StreamUploadOptions& options = {});

    /**
     * @brief Upload everything @p callback writes to the stream it is given.
     * @details The stream is closed when @p callback returns. If @p callback
     * or the upload fails, the multipart upload is aborted and the error is
     * rethrown.
     */
    void stream_upload(std::string_view bucket_name,
                       std::string_view object_key,
                       const std::function<void(ChunkedStream&)>& callback,
                       const StreamUploadOptions& options = {});

    /**
     * @brief Close every pooled connection. The client stays usable; the
     * next request opens a new pool.
     */
    void close();

  private:
    ConnectionSession<S3Connection> session_;

    void abort_quietly_(std::string_view bucket_name,
                        std::string_view object_key,
                        std::string_view upload_id) noexcept;
};
} // namespace s3stream
