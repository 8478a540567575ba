#pragma once

#include "s3stream.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for an S3 upload stream.
     * @details This struct contains the settings for a stream that uploads an
     * object of unknown size to S3 with a multipart upload, including the
     * endpoint and credentials, the destination bucket and object key, the
     * part size, and the number of parts to upload concurrently.
     * @note The custom headers, if given, must be a JSON object whose values
     * are strings, e.g. {"Content-Type": "application/octet-stream"}. They are
     * sent when the multipart upload is started.
     * @note A part size of 0 selects S3STREAM_MINIMUM_PART_SIZE, and a
     * max_workers of 0 selects S3STREAM_DEFAULT_MAX_WORKERS. max_workers may
     * not exceed S3STREAM_MAXIMUM_MAX_WORKERS.
     */
    typedef struct S3StreamSettings_s
    {
        const char* endpoint;          /**< URI of the S3 service. */
        const char* bucket_name;       /**< Destination bucket. Must exist. */
        const char* object_key;        /**< Destination object key. */
        const char* access_key_id;     /**< Access key ID. */
        const char* secret_access_key; /**< Secret access key. */
        const char* session_token;     /**< Optional session token. */
        const char* region;            /**< Optional region. */
        const char* custom_headers; /**< Optional JSON object of headers. */
        size_t part_size;   /**< Bytes per part, at least 5 MiB. */
        size_t max_workers; /**< Maximum number of concurrent part uploads. */
        bool serial; /**< Upload parts one at a time on the calling thread. */
    } S3StreamSettings;

    typedef struct S3Stream_s S3Stream;

    /**
     * @brief Get the version of the S3Stream API.
     * @return The version of the S3Stream API.
     */
    uint32_t S3Stream_get_api_version();

    /**
     * @brief Set the log level for the S3Stream API.
     * @param level The log level.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_set_log_level(S3StreamLogLevel level);

    /**
     * @brief Get the log level for the S3Stream API.
     * @return The log level for the S3Stream API.
     */
    S3StreamLogLevel S3Stream_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* S3Stream_get_status_message(S3StreamStatusCode status);

    /**
     * @brief Create an S3 upload stream.
     * @details No request is sent to S3 until the first part is complete or
     * the stream is closed.
     * @param[in] settings The settings for the stream.
     * @return A pointer to the stream, or NULL on failure.
     */
    S3Stream* S3Stream_create(const S3StreamSettings* settings);

    /**
     * @brief Append data to the stream.
     * @details Each time a part fills up it is handed to the uploader. With
     * the default (pipelined) uploader this function only blocks when
     * max_workers parts are already in flight.
     * @param[in, out] stream The stream.
     * @param[in] data The data to append.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes accepted by the stream.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_append(S3Stream* stream,
                                       const void* data,
                                       size_t bytes_in,
                                       size_t* bytes_out);

    /**
     * @brief Upload the final part and complete the multipart upload.
     * @details Blocks until every part has been uploaded. If any part failed,
     * the multipart upload is aborted and S3StreamStatusCode_IncompleteUpload
     * is returned; no truncated object is ever created. Once an append or a
     * close has failed, every later close returns
     * S3StreamStatusCode_IncompleteUpload. Closing a stream that received no
     * data creates an empty object.
     * @param[in, out] stream The stream.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_close(S3Stream* stream);

    /**
     * @brief Destroy a stream.
     * @details Closes the stream if it has not been closed, then frees the
     * memory allocated for it.
     * @param stream The stream to destroy.
     */
    void S3Stream_destroy(S3Stream* stream);

#ifdef __cplusplus
}
#endif
