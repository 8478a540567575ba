#pragma once

#include "connection.pool.hh"
#include "errors.hh"
#include "logger.hh"
#include "request.signer.hh"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace s3stream {
struct SessionSettings
{
    std::string endpoint;
    std::string region;

    /// Used when no credential provider is set.
    Credentials credentials;

    /// Called whenever the session needs credentials: on first use, when the
    /// connection pool is renewed, and after S3 rejected expired
    /// credentials.
    std::function<Credentials()> credential_provider;

    ConnectionPoolSettings connection_pool;

    /// Replace the connection pool (and with it every connection's TLS
    /// context) once it is this old.
    std::chrono::steady_clock::duration pool_refresh_interval{
        std::chrono::hours(24)
    };

    /// Defer creating the connection pool until the first request.
    bool lazy_init{ false };
};

/**
 * @brief The current connection pool and request signer of a client, and the
 * rules for replacing them.
 * @details The pool is replaced when it is older than the refresh interval,
 * or on demand after S3 rejected the credentials as expired. Requests already
 * running on the outgoing pool finish on their own connections, which are
 * closed when they are released to it.
 *
 * ConnectionT has the requirements of ConnectionPool.
 */
template<class ConnectionT>
class ConnectionSession
{
  public:
    using Pool = ConnectionPool<ConnectionT>;

    explicit ConnectionSession(SessionSettings settings)
      : settings_{ std::move(settings) }
    {
        if (settings_.endpoint.empty()) {
            throw ConfigurationError(LOG_ERROR("S3 endpoint is empty"));
        }
        if (!settings_.credential_provider && settings_.credentials.empty()) {
            throw ConfigurationError(
              LOG_ERROR("S3 credentials or a credential provider must be set"));
        }

        if (!settings_.lazy_init) {
            lease_(false);
        }
    }

    ~ConnectionSession() noexcept { close(); }

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /**
     * @brief Run @p request on a pooled connection and return its result.
     * @details If @p request throws CredentialExpiredError, the pool and
     * signer are replaced with fresh credentials and @p request runs once
     * more. A second failure propagates.
     */
    template<typename Request>
    auto with_connection(Request&& request)
    {
        auto lease = lease_(false);
        try {
            return run_(lease, request);
        } catch (const CredentialExpiredError& exc) {
            LOG_WARNING("Retrying with fresh credentials: ", exc.what());
        }

        lease = lease_(true);
        return run_(lease, request);
    }

    /**
     * @brief Close every pooled connection. The next request opens a new
     * pool.
     */
    void close() noexcept
    {
        std::shared_ptr<Pool> dead_pool;
        {
            std::scoped_lock lock(mutex_);
            dead_pool = std::move(pool_);
            signer_.reset();
        }

        if (dead_pool) {
            dead_pool->close();
        }
    }

    const SessionSettings& settings() const noexcept { return settings_; }

    /// How many pools this session has opened, counting the current one.
    size_t n_pools_opened() const noexcept { return n_pools_opened_.load(); }

  private:
    struct Lease
    {
        std::shared_ptr<Pool> pool;
        std::shared_ptr<const RequestSigner> signer;
    };

    const SessionSettings settings_;

    std::mutex mutex_;
    std::shared_ptr<Pool> pool_;
    std::shared_ptr<const RequestSigner> signer_;
    std::atomic<size_t> n_pools_opened_{ 0 };

    /**
     * @brief Get the current pool and signer, replacing them first if
     * @p force_new is set or the pool is due for renewal.
     */
    Lease lease_(bool force_new)
    {
        std::shared_ptr<Pool> dead_pool;
        Lease lease;
        {
            std::scoped_lock lock(mutex_);
            if (pool_ && !force_new &&
                pool_->age() <= settings_.pool_refresh_interval) {
                return { pool_, signer_ };
            }

            if (pool_) {
                LOG_INFO("Renewing S3 connection pool",
                         force_new ? " with fresh credentials" : "");
            }

            auto credentials = settings_.credential_provider
                                 ? settings_.credential_provider()
                                 : settings_.credentials;

            signer_ = std::make_shared<const RequestSigner>(
              std::move(credentials), settings_.region);
            dead_pool = std::move(pool_);
            pool_ = std::make_shared<Pool>(settings_.connection_pool);
            ++n_pools_opened_;

            lease = { pool_, signer_ };
        }

        // only close the old pool once the new one is in place
        if (dead_pool) {
            dead_pool->close();
        }

        return lease;
    }

    template<typename Request>
    auto run_(Lease& lease, Request& request)
    {
        auto connection =
          lease.pool->acquire(settings_.endpoint, *lease.signer);

        // a connection whose request threw is not returned to the pool
        auto result = request(*connection);
        lease.pool->release(std::move(connection));

        return result;
    }
};
} // namespace s3stream
