#include "s3stream.h"
#include "s3.stream.hh"
#include "errors.hh"
#include "macros.hh"

#include <cstdint> // uint32_t

#define S3STREAM_API_VERSION 0

namespace {
S3StreamStatusCode
status_from_exception(const std::exception_ptr& eptr, std::string_view what)
{
    try {
        std::rethrow_exception(eptr);
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Out of memory while ", what);
        return S3StreamStatusCode_OutOfMemory;
    } catch (const s3stream::StreamClosedError& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_StreamClosed;
    } catch (const s3stream::UnsupportedOperationError& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_NotSupported;
    } catch (const s3stream::ConfigurationError& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_InvalidSettings;
    } catch (const s3stream::IncompleteUploadError& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_IncompleteUpload;
    } catch (const s3stream::ServerError& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_IOError;
    } catch (const std::exception& e) {
        LOG_ERROR("Error ", what, ": ", e.what());
        return S3StreamStatusCode_InternalError;
    }
}
} // namespace

extern "C"
{
    uint32_t S3Stream_get_api_version()
    {
        return S3STREAM_API_VERSION;
    }

    S3StreamStatusCode S3Stream_set_log_level(S3StreamLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case S3StreamLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case S3StreamLogLevel_Info:
                level = LogLevel_Info;
                break;
            case S3StreamLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case S3StreamLogLevel_Error:
                level = LogLevel_Error;
                break;
            case S3StreamLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return S3StreamStatusCode_InvalidArgument;
        }

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return S3StreamStatusCode_InternalError;
        }
        return S3StreamStatusCode_Success;
    }

    S3StreamLogLevel S3Stream_get_log_level()
    {
        S3StreamLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = S3StreamLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = S3StreamLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = S3StreamLogLevel_Warning;
                break;
            case LogLevel_None:
                level = S3StreamLogLevel_None;
                break;
            default:
                level = S3StreamLogLevel_Error;
                break;
        }
        return level;
    }

    const char* S3Stream_get_status_message(S3StreamStatusCode code)
    {
        switch (code) {
            case S3StreamStatusCode_Success:
                return "Success";
            case S3StreamStatusCode_InvalidArgument:
                return "Invalid argument";
            case S3StreamStatusCode_InvalidSettings:
                return "Invalid settings";
            case S3StreamStatusCode_StreamClosed:
                return "Stream is closed";
            case S3StreamStatusCode_NotSupported:
                return "Operation not supported";
            case S3StreamStatusCode_IncompleteUpload:
                return "Incomplete upload";
            case S3StreamStatusCode_IOError:
                return "I/O error";
            case S3StreamStatusCode_InternalError:
                return "Internal error";
            case S3StreamStatusCode_OutOfMemory:
                return "Out of memory";
            default:
                return "Unknown error";
        }
    }

    S3Stream_s* S3Stream_create(const struct S3StreamSettings_s* settings)
    {
        S3Stream_s* stream = nullptr;

        try {
            stream = new S3Stream_s(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for S3 stream");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating S3 stream: ", e.what());
        }

        return stream;
    }

    S3StreamStatusCode S3Stream_append(struct S3Stream_s* stream,
                                       const void* data,
                                       size_t bytes_in,
                                       size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(data || bytes_in == 0, "Null pointer: data");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");

        *bytes_out = 0;
        try {
            *bytes_out = stream->append(data, bytes_in);
        } catch (...) {
            return status_from_exception(std::current_exception(),
                                         "appending data");
        }

        return S3StreamStatusCode_Success;
    }

    S3StreamStatusCode S3Stream_close(struct S3Stream_s* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            stream->close();
        } catch (...) {
            return status_from_exception(std::current_exception(),
                                         "closing stream");
        }

        return S3StreamStatusCode_Success;
    }

    void S3Stream_destroy(struct S3Stream_s* stream)
    {
        if (stream == nullptr) {
            return;
        }

        delete stream;
    }
}
