#pragma once

#include "logger.hh"

#include <stdexcept>
#include <string>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

/// Check that a==b
/// example: `EXPECT_EQ(int,42,meaning_of_life())`
#define EXPECT_EQ(T, a, b)                                                     \
    do {                                                                       \
        T a_ = (T)(a);                                                         \
        T b_ = (T)(b);                                                         \
        EXPECT(                                                                \
          a_ == b_, "Expected ", #a, " == ", #b, " but ", a_, " != ", b_);     \
    } while (0)

#define EXPECT_STR_EQ(a, b)                                                    \
    do {                                                                       \
        std::string a_ = (a) ? (a) : "";                                       \
        std::string b_ = (b) ? (b) : "";                                       \
        EXPECT(a_ == b_,                                                       \
               "Expected ",                                                    \
               #a,                                                             \
               " == ",                                                         \
               #b,                                                             \
               " but '",                                                       \
               a_,                                                             \
               "' != '",                                                       \
               b_,                                                             \
               "'");                                                           \
    } while (0)

/// Check that evaluating `expr` throws an exception of type E
/// example: `EXPECT_THROWS(StreamClosedError, stream.write(data))`
#define EXPECT_THROWS(E, expr)                                                 \
    do {                                                                       \
        bool thrown_ = false;                                                  \
        try {                                                                  \
            expr;                                                              \
        } catch (const E&) {                                                   \
            thrown_ = true;                                                    \
        }                                                                      \
        EXPECT(thrown_, "Expected ", #expr, " to throw ", #E);                 \
    } while (0)
