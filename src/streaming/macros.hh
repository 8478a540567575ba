#pragma once

#include "errors.hh"
#include "logger.hh"

#include <stdexcept>

// Internal invariant violations.
#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

// Bad options or arguments supplied by the caller.
#define EXPECT_SETTING(e, ...)                                                 \
    do {                                                                       \
        if (!(e)) {                                                            \
            throw s3stream::ConfigurationError(LOG_ERROR(__VA_ARGS__));        \
        }                                                                      \
    } while (0)

#define EXPECT_OBJECT_TARGET(bucket, key)                                      \
    do {                                                                       \
        EXPECT_SETTING(!(bucket).empty(), "Bucket name must not be empty");    \
        EXPECT_SETTING(!(key).empty(), "Object key must not be empty");        \
    } while (0)

// For the C API, which reports bad arguments instead of throwing.
#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return S3StreamStatusCode_InvalidArgument;                         \
        }                                                                      \
    } while (0)
