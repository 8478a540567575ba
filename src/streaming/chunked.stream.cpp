#include "macros.hh"
#include "chunked.stream.hh"
#include "errors.hh"

#include <algorithm>

s3stream::ChunkedStream::ChunkedStream(size_t chunk_size,
                                       std::unique_ptr<ChunkHandler> handler)
  : chunk_size_{ chunk_size }
  , handler_{ std::move(handler) }
{
    EXPECT_SETTING(chunk_size_ > 0, "Chunk size must be positive");
    EXPECT_SETTING(handler_, "Null pointer: handler");

    buffer_.reserve(chunk_size_);
}

s3stream::ChunkedStream::~ChunkedStream() noexcept
{
    if (!closed_) {
        LOG_WARNING("Stream destroyed without being closed. ",
                    bytes_written_,
                    " bytes were not uploaded.");
    }
}

void
s3stream::ChunkedStream::write(std::span<const std::byte> data)
{
    check_open_();

    while (!data.empty()) {
        const auto remaining_capacity = chunk_size_ - buffer_.size();
        const auto bytes_to_write = std::min(data.size(), remaining_capacity);

        buffer_.insert(buffer_.end(), data.begin(), data.begin() + bytes_to_write);
        data = data.subspan(bytes_to_write);
        bytes_written_ += bytes_to_write;

        if (buffer_.size() == chunk_size_) {
            flush();
        }
    }
}

void
s3stream::ChunkedStream::flush()
{
    check_open_();

    if (buffer_.empty()) {
        return;
    }

    open_handler_();

    // only the final chunk may be short
    if (buffer_.size() < chunk_size_) {
        return;
    }

    dispatch_();
}

void
s3stream::ChunkedStream::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;

    // an empty stream still gets one (empty) chunk, so that an empty object
    // is created
    if (!buffer_.empty() || chunks_dispatched_ == 0) {
        open_handler_();
        dispatch_();
    }

    handler_->close();
}

size_t
s3stream::ChunkedStream::read(std::span<std::byte>)
{
    throw UnsupportedOperationError(LOG_ERROR("Write-only stream"));
}

void
s3stream::ChunkedStream::check_open_() const
{
    if (closed_) {
        throw StreamClosedError();
    }
}

void
s3stream::ChunkedStream::open_handler_()
{
    if (!opened_) {
        handler_->open();
        opened_ = true;
    }
}

void
s3stream::ChunkedStream::dispatch_()
{
    auto recycled = handler_->write(std::move(buffer_));
    ++chunks_dispatched_;

    if (recycled) {
        buffer_ = std::move(*recycled);
        buffer_.clear();
    } else {
        buffer_ = ChunkBuffer{};
    }
    buffer_.reserve(chunk_size_);
}
