#pragma once

#include "chunk.handler.hh"

#include <cstddef> // size_t, std::byte
#include <memory>  // std::unique_ptr
#include <span>    // std::span

namespace s3stream {
/**
 * @brief A write-only stream that cuts its input into fixed-size chunks and
 * forwards each chunk to a ChunkHandler.
 * @details The handler is opened lazily, when the first byte is flushed, so
 * constructing a stream has no side effects. Closing a stream that never
 * received any data still opens the handler and forwards one empty chunk.
 */
class ChunkedStream
{
  public:
    ChunkedStream(size_t chunk_size, std::unique_ptr<ChunkHandler> handler);
    ~ChunkedStream() noexcept;

    ChunkedStream(const ChunkedStream&) = delete;
    ChunkedStream& operator=(const ChunkedStream&) = delete;

    /**
     * @brief Append @p data to the stream, forwarding every chunk that fills
     * up.
     * @throws StreamClosedError if the stream is closed.
     */
    void write(std::span<const std::byte> data);

    /**
     * @brief Forward the buffered bytes if they make up a complete chunk.
     * @details A partial chunk stays buffered until more data arrives or the
     * stream is closed. Does nothing if the buffer is empty.
     * @throws StreamClosedError if the stream is closed.
     */
    void flush();

    /**
     * @brief Forward the last (possibly short) chunk and close the handler.
     * @details Closing a closed stream does nothing.
     */
    void close();

    /**
     * @brief Always throws: the stream is write-only.
     * @throws UnsupportedOperationError
     */
    size_t read(std::span<std::byte> buf);

    [[nodiscard]] bool is_closed() const noexcept { return closed_; }
    size_t chunk_size() const noexcept { return chunk_size_; }
    size_t bytes_written() const noexcept { return bytes_written_; }
    size_t chunks_dispatched() const noexcept { return chunks_dispatched_; }

  private:
    size_t chunk_size_;
    std::unique_ptr<ChunkHandler> handler_;

    ChunkBuffer buffer_;
    bool opened_{ false };
    bool closed_{ false };

    size_t bytes_written_{ 0 };
    size_t chunks_dispatched_{ 0 };

    void check_open_() const;
    void open_handler_();

    /// Hand the current buffer to the handler and replace it.
    void dispatch_();
};
} // namespace s3stream
