#pragma once

#include <cstddef> // std::byte
#include <optional>
#include <vector>

namespace s3stream {
using ChunkBuffer = std::vector<std::byte>;

/**
 * @brief Consumes the chunks produced by a ChunkedStream.
 */
class ChunkHandler
{
  public:
    virtual ~ChunkHandler() = default;

    /**
     * @brief Called once, before the first chunk.
     */
    virtual void open() = 0;

    /**
     * @brief Consume one chunk. Called once per chunk, in order.
     * @details The handler may process the chunk synchronously or
     * asynchronously. It may hand back a buffer (the chunk itself, or an
     * earlier chunk whose processing has finished) for the stream to reuse;
     * returning std::nullopt is always safe and makes the stream allocate a
     * fresh buffer.
     * @param chunk The chunk. Every chunk but the last has exactly the
     * stream's chunk size.
     * @return A buffer to recycle, or std::nullopt.
     */
    virtual std::optional<ChunkBuffer> write(ChunkBuffer&& chunk) = 0;

    /**
     * @brief Called once, after the last chunk.
     */
    virtual void close() = 0;
};
} // namespace s3stream
