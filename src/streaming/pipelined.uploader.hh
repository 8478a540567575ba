#pragma once

#include "completion.queue.hh"
#include "multipart.uploader.hh"
#include "thread.pool.hh"

#include <atomic>
#include <vector>

namespace s3stream {
/**
 * @brief Uploads up to max_workers parts concurrently.
 * @details Each chunk is uploaded by a job on a thread pool of max_workers
 * threads. Finished jobs hand their part and their buffer back through a
 * completion queue; write() collects them, which both recycles buffers and
 * throttles the writer: once max_workers parts are in flight, write() blocks
 * until one of them finishes. Parts finish in any order and are sorted by
 * part number when the upload is completed.
 *
 * A failed part upload is logged and closes the completion queue. The upload
 * is then never completed; close() throws IncompleteUploadError and the
 * caller should abort the multipart upload.
 */
class PipelinedUploader : public MultipartUploader
{
  public:
    PipelinedUploader(std::shared_ptr<StorageClient> client,
                      std::string_view bucket_name,
                      std::string_view object_key,
                      Headers headers = {},
                      unsigned int max_workers = 8);
    ~PipelinedUploader() noexcept override;

    std::optional<ChunkBuffer> write(ChunkBuffer&& chunk) override;
    void close() override;

    unsigned int max_workers() const noexcept { return max_workers_; }

    /// The largest number of parts that were ever in flight at once.
    size_t max_parts_in_flight() const noexcept { return max_in_flight_; }

  private:
    struct JobResult
    {
        Part part;
        ChunkBuffer buffer;
    };

    unsigned int max_workers_;
    unsigned int next_part_number_{ 1 };

    // dispatched, but not yet collected; only touched by the writer
    size_t in_flight_{ 0 };
    size_t max_in_flight_{ 0 };

    std::atomic<size_t> jobs_finished_{ 0 };
    CompletionQueue<JobResult> job_results_;
    std::vector<Part> uploaded_parts_;

    std::unique_ptr<ThreadPool> thread_pool_;

    /// Take a finished job's part, returning its buffer.
    ChunkBuffer collect_(JobResult&& result);

    [[nodiscard]] size_t parts_started_() const noexcept;

    void stop_workers_() noexcept;
};
} // namespace s3stream
