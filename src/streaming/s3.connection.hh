#pragma once

#include "request.signer.hh"
#include "storage.client.hh"

#include <cstddef> // std::byte
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace minio::s3 {
class Client;
} // namespace minio::s3

namespace s3stream {
/**
 * @brief A single client connection to an S3 endpoint, with a request signer
 * attached.
 * @details Failed requests are logged and raised as ServerError, or as
 * CredentialExpiredError when S3 rejects the credentials as expired.
 */
class S3Connection
{
  public:
    S3Connection(std::string_view endpoint, const RequestSigner& signer);
    ~S3Connection() noexcept;

    S3Connection(const S3Connection&) = delete;
    S3Connection& operator=(const S3Connection&) = delete;

    /// Lists buckets to see whether the endpoint answers with our credentials.
    bool check_connection();

    bool bucket_exists(std::string_view bucket_name);

    /**
     * @brief Stat @p object_name in @p bucket_name.
     * @returns False if the object is missing or the stat fails.
     * @throws ConfigurationError if the bucket or the key is empty.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    /// Returns false, after logging, if S3 refuses the delete.
    bool delete_object(std::string_view bucket_name,
                       std::string_view object_name);

    /**
     * @brief Start a multipart upload to @p object_name.
     * @details @p headers (content type, user metadata, ...) are applied to
     * the object when the upload is completed.
     * @returns The upload id S3 assigned.
     * @throws ServerError or CredentialExpiredError if S3 rejects the request.
     */
    std::string create_multipart_object(std::string_view bucket_name,
                                        std::string_view object_name,
                                        const Headers& headers);

    /**
     * @brief Send @p data as part @p part_number of upload @p upload_id.
     * @details Part numbers start at 1. Every part but the last must be at
     * least 5 MiB; S3 checks this only on completion.
     * @returns The part number and the ETag S3 returned for it.
     * @throws ServerError or CredentialExpiredError if S3 rejects the request.
     */
    Part upload_multipart_object_part(std::string_view bucket_name,
                                      std::string_view object_name,
                                      std::string_view upload_id,
                                      std::span<const std::byte> data,
                                      unsigned int part_number);

    /// @p parts must be sorted by part number with no gaps.
    /// @throws ServerError or CredentialExpiredError if S3 rejects the request.
    CompletedUpload complete_multipart_object(std::string_view bucket_name,
                                              std::string_view object_name,
                                              std::string_view upload_id,
                                              const std::vector<Part>& parts);

    /// Discard every part of @p upload_id. Failures are logged, not thrown.
    bool abort_multipart_object(std::string_view bucket_name,
                                std::string_view object_name,
                                std::string_view upload_id);

    /**
     * @brief Release the underlying client. Closing twice does nothing.
     */
    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept { return client_ == nullptr; }

  private:
    RequestSigner signer_;
    std::unique_ptr<minio::creds::Provider> provider_;
    std::unique_ptr<minio::s3::Client> client_;

    minio::s3::Client& client_or_throw_();
};
} // namespace s3stream
