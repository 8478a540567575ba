#include "thread.pool.hh"

#include <algorithm>
#include <exception>

s3stream::ThreadPool::ThreadPool(unsigned int n_threads, ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    n_threads = std::max(n_threads, 1u);

    threads_.reserve(n_threads);
    for (auto i = 0u; i < n_threads; ++i) {
        threads_.emplace_back([this] { worker_loop_(); });
    }
}

s3stream::ThreadPool::~ThreadPool() noexcept
{
    await_stop();
}

bool
s3stream::ThreadPool::push_job(Task&& job)
{
    {
        std::scoped_lock lock(jobs_mutex_);
        if (!is_accepting_jobs_) {
            return false;
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();

    return true;
}

void
s3stream::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(jobs_mutex_);
        is_accepting_jobs_ = false;
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void
s3stream::ThreadPool::worker_loop_()
{
    while (true) {
        Task job;
        {
            std::unique_lock lock(jobs_mutex_);
            cv_.wait(lock,
                     [this] { return !is_accepting_jobs_ || !jobs_.empty(); });

            // drain the queue before stopping
            if (jobs_.empty()) {
                return;
            }

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        run_(job);
    }
}

void
s3stream::ThreadPool::run_(Task& job)
{
    std::string err;
    bool ok = false;
    try {
        ok = job(err);
    } catch (const std::exception& exc) {
        err = exc.what();
    }

    if (!ok) {
        ++n_jobs_failed_;
        if (error_handler_) {
            error_handler_(err);
        }
    }
}
