#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace s3stream {
/**
 * @brief A fixed set of worker threads running upload jobs.
 * @details A job reports failure by returning false and filling in its
 * std::string& argument, or by throwing. Either way the diagnostic goes to
 * the error callback and the job is counted as failed; the pool keeps
 * running.
 */
class ThreadPool
{
  public:
    using Task = std::function<bool(std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    /// At least one thread is started. Uploads are I/O bound, so @p n_threads
    /// is not capped at the number of cores.
    ThreadPool(unsigned int n_threads, ErrorCallback&& err);
    ~ThreadPool() noexcept;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Push a job onto the job queue.
     * @return False if the pool is stopping and the job was dropped.
     */
    [[nodiscard]] bool push_job(Task&& job);

    /**
     * @brief Stop accepting jobs, run every queued job, then join the
     * threads. Calling this again does nothing.
     */
    void await_stop() noexcept;

    size_t n_threads() const noexcept { return threads_.size(); }

    /// Number of jobs that returned false or threw.
    size_t n_jobs_failed() const noexcept { return n_jobs_failed_.load(); }

  private:
    ErrorCallback error_handler_;

    std::vector<std::thread> threads_;
    std::mutex jobs_mutex_;
    std::condition_variable cv_;
    std::queue<Task> jobs_;
    bool is_accepting_jobs_{ true };

    std::atomic<size_t> n_jobs_failed_{ 0 };

    void worker_loop_();
    void run_(Task& job);
};
} // namespace s3stream
