#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace s3stream {
/**
 * @brief A closable queue for handing results from worker threads back to a
 * single consumer.
 * @details Once closed, no more items are accepted, but items already queued
 * can still be received.
 */
template<typename T>
class CompletionQueue
{
  public:
    CompletionQueue() = default;
    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    /**
     * @brief Enqueue an item and wake the consumer.
     * @return False if the queue is closed and the item was dropped.
     */
    bool send(T&& item)
    {
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push(std::move(item));
        }
        cv_.notify_one();

        return true;
    }

    /**
     * @brief Block until an item is available or the queue is closed.
     * @return The next item, or std::nullopt if the queue is closed and
     * drained.
     */
    std::optional<T> receive()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });

        return pop_();
    }

    /**
     * @brief Take the next item if one is available, without blocking.
     */
    std::optional<T> try_receive()
    {
        std::scoped_lock lock(mutex_);
        return pop_();
    }

    /**
     * @brief Close the queue. Closing a closed queue does nothing.
     * @return True if this call closed the queue.
     */
    bool close()
    {
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
        }
        cv_.notify_all();

        return true;
    }

    [[nodiscard]] bool is_closed() const
    {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> items_;
    bool closed_{ false };

    std::optional<T> pop_()
    {
        if (items_.empty()) {
            return std::nullopt;
        }

        auto item = std::move(items_.front());
        items_.pop();
        return item;
    }
};
} // namespace s3stream
