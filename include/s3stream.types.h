#ifndef H_S3STREAM_TYPES_V0
#define H_S3STREAM_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        S3StreamStatusCode_Success = 0,
        S3StreamStatusCode_InvalidArgument,
        S3StreamStatusCode_InvalidSettings,
        S3StreamStatusCode_StreamClosed,
        S3StreamStatusCode_NotSupported,
        S3StreamStatusCode_IncompleteUpload,
        S3StreamStatusCode_IOError,
        S3StreamStatusCode_InternalError,
        S3StreamStatusCode_OutOfMemory,
        S3StreamStatusCodeCount,
    } S3StreamStatusCode;

    typedef enum
    {
        S3StreamLogLevel_Debug,
        S3StreamLogLevel_Info,
        S3StreamLogLevel_Warning,
        S3StreamLogLevel_Error,
        S3StreamLogLevel_None,
        S3StreamLogLevelCount
    } S3StreamLogLevel;

/** The smallest part size S3 accepts for every part but the last. */
#define S3STREAM_MINIMUM_PART_SIZE 5242880

/** Default number of parts uploaded concurrently. */
#define S3STREAM_DEFAULT_MAX_WORKERS 8

/** Largest number of parts that may be uploaded concurrently. */
#define S3STREAM_MAXIMUM_MAX_WORKERS 256

#ifdef __cplusplus
}
#endif

#endif // H_S3STREAM_TYPES_V0
