#pragma once

#include "storage.client.hh"

#include <memory>
#include <string>

namespace minio::creds {
class Provider;
} // namespace minio::creds

namespace s3stream {
struct Credentials
{
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    /**
     * @brief Read AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and (optionally)
     * AWS_SESSION_TOKEN from the environment.
     * @throws ConfigurationError if the key id or the secret is not set.
     */
    static Credentials from_environment();

    [[nodiscard]] bool empty() const noexcept;
};

/**
 * @brief The signing step attached to every connection.
 * @details minio-cpp builds and signs every request afresh, so the only
 * headers that can carry a stale signature are the ones a caller hands in,
 * e.g., headers copied from an earlier request. S3 rejects a request with two
 * signatures, so caller-supplied headers go through prepare() before they are
 * attached to a request and signed with this signer's credentials.
 */
class RequestSigner
{
  public:
    RequestSigner(Credentials credentials, std::string region = {});

    /**
     * @brief Remove headers left over from a previous signature.
     * @details Removes Authorization, X-Amz-Content-Sha256 and X-Amz-Date,
     * compared case-insensitively.
     */
    void prepare(Headers& headers) const;

    /// A copy of @p headers with prepare() applied.
    [[nodiscard]] Headers prepared(Headers headers) const;

    /**
     * @brief Make the credential provider the S3 client signs requests with.
     */
    std::unique_ptr<minio::creds::Provider> make_provider() const;

    const Credentials& credentials() const noexcept { return credentials_; }
    const std::string& region() const noexcept { return region_; }

  private:
    Credentials credentials_;
    std::string region_;
};

/**
 * @brief Whether @p header is one of the headers a signature sets.
 */
[[nodiscard]] bool
is_signature_header(std::string_view header);
} // namespace s3stream
