#pragma once

#include "logger.hh"
#include "request.signer.hh"

#include <algorithm>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace s3stream {
namespace detail {
/**
 * @brief Identifies the calling thread, and lets the pool tell whether that
 * thread is still running.
 */
struct ThreadAffinity
{
    std::thread::id id;
    std::weak_ptr<const void> alive; // expires when the thread exits
};

ThreadAffinity
current_thread_affinity();
} // namespace detail

struct ConnectionPoolSettings
{
    /// Connections idle for longer than this are closed instead of reused.
    /// No limit if unset.
    std::optional<std::chrono::steady_clock::duration> ttl{
        std::chrono::minutes(5)
    };

    /// Maximum number of idle connections kept. 0 disables pooling.
    size_t max_size{ 128 };
};

/**
 * @brief Keeps idle connections for reuse, one per thread.
 * @details A connection released by a thread is handed back to the same
 * thread on its next acquire(), saving the cost of setting up a new
 * connection. Affinity only saves work: a thread without a pooled connection
 * simply gets a new one.
 *
 * ConnectionT must be constructible from (std::string_view endpoint,
 * const RequestSigner&) and provide a noexcept close().
 */
template<class ConnectionT>
class ConnectionPool
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit ConnectionPool(ConnectionPoolSettings settings = {})
      : settings_{ settings }
      , created_at_{ Clock::now() }
    {
    }

    ~ConnectionPool() noexcept { close(); }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Get a connection for the calling thread.
     * @details Returns the connection this thread released last if it has not
     * expired. Otherwise makes a new connection to @p endpoint, signing its
     * requests with @p signer.
     */
    std::unique_ptr<ConnectionT> acquire(std::string_view endpoint,
                                         const RequestSigner& signer)
    {
        const auto affinity = detail::current_thread_affinity();

        std::unique_ptr<ConnectionT> connection;
        Clock::time_point last_used;
        {
            std::scoped_lock lock(mutex_);
            if (!closed_) {
                if (auto it = find_(affinity.id); it != entries_.end()) {
                    connection = std::move(it->connection);
                    last_used = it->last_used;
                    entries_.erase(it);
                }
            }
        }

        if (connection) {
            if (!is_expired_(last_used, Clock::now())) {
                return connection;
            }
            connection->close();
        }

        LOG_DEBUG("Opening new connection to ", endpoint);
        return std::make_unique<ConnectionT>(endpoint, signer);
    }

    /**
     * @brief Return a connection to the pool for the calling thread.
     * @details At most one connection is kept per thread. If the pool is
     * over capacity, the oldest connection is closed. Connections of threads
     * that have exited, or that have expired, are closed as they are found.
     */
    void release(std::unique_ptr<ConnectionT>&& connection)
    {
        if (!connection) {
            return;
        }

        if (settings_.max_size == 0) {
            connection->close();
            return;
        }

        const auto affinity = detail::current_thread_affinity();
        const auto now = Clock::now();

        // close these outside the lock; closing a socket can be slow
        std::vector<std::unique_ptr<ConnectionT>> dead;
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                dead.push_back(std::move(connection));
            } else {
                if (!entries_.empty()) {
                    auto& oldest = entries_.front();
                    if (oldest.owner_alive.expired() ||
                        is_expired_(oldest.last_used, now)) {
                        dead.push_back(std::move(oldest.connection));
                        entries_.pop_front();
                    }
                }

                if (auto it = find_(affinity.id); it != entries_.end()) {
                    dead.push_back(std::move(it->connection));
                    entries_.erase(it);
                }

                entries_.push_back({ affinity.id,
                                     affinity.alive,
                                     std::move(connection),
                                     now });

                if (entries_.size() > settings_.max_size) {
                    dead.push_back(std::move(entries_.front().connection));
                    entries_.pop_front();
                }
            }
        }

        for (auto& conn : dead) {
            conn->close();
        }
    }

    /**
     * @brief Close every pooled connection. Closing twice does nothing.
     * @details After closing, acquire() returns new connections and release()
     * closes what it is given.
     */
    void close() noexcept
    {
        std::list<Entry> entries;
        {
            std::scoped_lock lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            entries.swap(entries_);
        }

        for (auto& entry : entries) {
            entry.connection->close();
        }
    }

    [[nodiscard]] bool is_closed() const
    {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    size_t size() const
    {
        std::scoped_lock lock(mutex_);
        return entries_.size();
    }

    Clock::time_point created_at() const noexcept { return created_at_; }

    Clock::duration age() const { return Clock::now() - created_at_; }

  private:
    struct Entry
    {
        std::thread::id owner;
        std::weak_ptr<const void> owner_alive;
        std::unique_ptr<ConnectionT> connection;
        Clock::time_point last_used;
    };

    const ConnectionPoolSettings settings_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::list<Entry> entries_; // oldest first
    bool closed_{ false };

    typename std::list<Entry>::iterator find_(std::thread::id owner)
    {
        return std::find_if(
          entries_.begin(), entries_.end(), [owner](const Entry& entry) {
              return entry.owner == owner;
          });
    }

    bool is_expired_(Clock::time_point last_used, Clock::time_point now) const
    {
        return settings_.ttl.has_value() && now - last_used > *settings_.ttl;
    }
};
} // namespace s3stream
