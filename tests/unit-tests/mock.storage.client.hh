#pragma once

#include "errors.hh"
#include "storage.client.hh"

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <vector>

/**
 * @brief An in-memory StorageClient that records what it is asked to do.
 * @details `before_upload` and `after_upload` run on the uploading thread
 * around recording a part; tests use them to delay or reorder part
 * completion. Setting
 * `failing_part` makes the upload of that part throw a ServerError.
 */
class MockStorageClient : public s3stream::StorageClient
{
  public:
    struct UploadedPart
    {
        unsigned int number;
        std::vector<std::byte> data;
    };

    std::function<void(unsigned int)> before_upload;
    std::function<void(unsigned int)> after_upload;
    unsigned int failing_part{ 0 };

    std::string start_multipart_upload(std::string_view bucket_name,
                                       std::string_view object_key,
                                       const s3stream::Headers& headers) override
    {
        std::scoped_lock lock(mutex_);
        ++n_started;
        last_headers = headers;
        return "upload-" + std::to_string(n_started);
    }

    s3stream::Part upload_part(std::string_view bucket_name,
                               std::string_view object_key,
                               std::string_view upload_id,
                               unsigned int part_number,
                               std::span<const std::byte> data) override
    {
        {
            std::scoped_lock lock(mutex_);
            ++in_flight_;
            max_concurrent_uploads = std::max(max_concurrent_uploads,
                                              in_flight_);
        }

        if (before_upload) {
            before_upload(part_number);
        }

        {
            std::scoped_lock lock(mutex_);
            --in_flight_;

            if (part_number == failing_part) {
                throw s3stream::ServerError(
                  "Injected failure uploading part " +
                    std::to_string(part_number),
                  "InternalError");
            }

            uploaded.push_back({ part_number, { data.begin(), data.end() } });
            completion_order.push_back(part_number);
        }

        if (after_upload) {
            after_upload(part_number);
        }

        return { part_number, "etag-" + std::to_string(part_number) };
    }

    s3stream::CompletedUpload complete_multipart_upload(
      std::string_view bucket_name,
      std::string_view object_key,
      std::string_view upload_id,
      const std::vector<s3stream::Part>& parts) override
    {
        std::scoped_lock lock(mutex_);
        ++n_completed;
        completed_parts = parts;
        return { std::string(object_key), "etag-final" };
    }

    bool abort_multipart_upload(std::string_view bucket_name,
                                std::string_view object_key,
                                std::string_view upload_id) override
    {
        std::scoped_lock lock(mutex_);
        ++n_aborted;
        return true;
    }

    int n_started{ 0 };
    int n_completed{ 0 };
    int n_aborted{ 0 };
    size_t max_concurrent_uploads{ 0 };

    s3stream::Headers last_headers;
    std::vector<UploadedPart> uploaded;
    std::vector<unsigned int> completion_order;
    std::vector<s3stream::Part> completed_parts;

  private:
    std::mutex mutex_;
    size_t in_flight_{ 0 };
};

/// Blocks callers of wait() until a count of events has been reached.
class Gate
{
  public:
    void notify()
    {
        {
            std::scoped_lock lock(mutex_);
            ++count_;
        }
        cv_.notify_all();
    }

    void wait(int count)
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this, count] { return count_ >= count; });
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_{ 0 };
};
