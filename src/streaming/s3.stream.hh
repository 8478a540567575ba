#pragma once

#include "chunked.stream.hh"
#include "multipart.uploader.hh"
#include "s3.client.hh"

#include <cstddef> // size_t
#include <memory>  // unique_ptr, shared_ptr
#include <string>
#include <string_view>

struct S3Stream_s
{
  public:
    S3Stream_s(const struct S3StreamSettings_s* settings);

    /// Upload to @p bucket_name/@p object_key through @p client.
    S3Stream_s(std::shared_ptr<s3stream::StorageClient> client,
               std::string_view bucket_name,
               std::string_view object_key,
               const s3stream::StreamUploadOptions& options);
    ~S3Stream_s();

    /**
     * @brief Append data to the stream.
     * @param data The data to append.
     * @param nbytes The number of bytes to append.
     * @return The number of bytes appended.
     */
    size_t append(const void* data, size_t nbytes);

    /**
     * @brief Upload the final part and complete the upload.
     * @details On failure the multipart upload is aborted before the error is
     * rethrown. Closing a closed stream does nothing.
     * @throws IncompleteUploadError if an earlier failure aborted the upload.
     */
    void close();

    [[nodiscard]] bool is_closed() const noexcept
    {
        return state_ != State::Open;
    }
    [[nodiscard]] bool is_aborted() const noexcept
    {
        return state_ == State::Aborted;
    }

  private:
    enum class State
    {
        Open,
        Closed,
        Aborted,
    };

    std::string bucket_name_;
    std::string object_key_;
    State state_;

    // set when the upload is aborted
    std::string failure_;
    size_t parts_dispatched_;

    std::shared_ptr<s3stream::StorageClient> client_;
    std::unique_ptr<s3stream::ChunkedStream> stream_;

    // owned by stream_
    const s3stream::MultipartUploader* uploader_;

    void open_(const s3stream::StreamUploadOptions& options);

    /// Release the stream and abort its multipart upload, if one was started.
    void abort_(const std::string& reason) noexcept;

    [[noreturn]] void throw_aborted_() const;
};
