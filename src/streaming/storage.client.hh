#pragma once

#include <cstddef> // std::byte
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s3stream {
using Headers = std::map<std::string, std::string>;

/// One uploaded part of a multipart upload. S3 numbers parts from 1.
struct Part
{
    unsigned int number{ 0 };
    std::string etag;
};

/// The object created by completing a multipart upload.
struct CompletedUpload
{
    std::string key;
    std::string etag;
};

/**
 * @brief The multipart upload calls the uploaders need from an object store.
 * @details Implementations throw ServerError (or CredentialExpiredError) when
 * a request fails. Every method may be called concurrently from several
 * threads.
 */
class StorageClient
{
  public:
    virtual ~StorageClient() = default;

    /**
     * @brief Start a multipart upload.
     * @param bucket_name The destination bucket.
     * @param object_key The destination object key.
     * @param headers Headers to send with the request, e.g., Content-Type.
     * @return The upload id of the new multipart upload.
     */
    virtual std::string start_multipart_upload(std::string_view bucket_name,
                                               std::string_view object_key,
                                               const Headers& headers) = 0;

    /**
     * @brief Upload one part of a multipart upload.
     * @param part_number The 1-based number of the part.
     * @param data The bytes of the part. May be empty only for the single part
     * of an empty object.
     * @return The part, with the entity tag S3 assigned to it.
     */
    virtual Part upload_part(std::string_view bucket_name,
                             std::string_view object_key,
                             std::string_view upload_id,
                             unsigned int part_number,
                             std::span<const std::byte> data) = 0;

    /**
     * @brief Combine the uploaded parts into the final object.
     * @param parts The parts, in ascending order of part number.
     */
    virtual CompletedUpload complete_multipart_upload(
      std::string_view bucket_name,
      std::string_view object_key,
      std::string_view upload_id,
      const std::vector<Part>& parts) = 0;

    /**
     * @brief Abort a multipart upload, discarding any uploaded parts.
     * @return True if S3 accepted the abort, otherwise false.
     */
    virtual bool abort_multipart_upload(std::string_view bucket_name,
                                        std::string_view object_key,
                                        std::string_view upload_id) = 0;
};
} // namespace s3stream
