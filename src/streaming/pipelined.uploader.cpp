#include "macros.hh"
#include "pipelined.uploader.hh"
#include "errors.hh"
#include "upload.parts.hh"

#include <algorithm>

s3stream::PipelinedUploader::PipelinedUploader(
  std::shared_ptr<StorageClient> client,
  std::string_view bucket_name,
  std::string_view object_key,
  Headers headers,
  unsigned int max_workers)
  : MultipartUploader(std::move(client),
                      bucket_name,
                      object_key,
                      std::move(headers))
  , max_workers_{ max_workers }
{
    EXPECT_SETTING(max_workers_ > 0, "max_workers must be greater than zero");

    thread_pool_ = std::make_unique<ThreadPool>(
      max_workers_, [](const std::string& err) { LOG_ERROR(err); });
}

s3stream::PipelinedUploader::~PipelinedUploader() noexcept
{
    job_results_.close();
    stop_workers_();
}

std::optional<s3stream::ChunkBuffer>
s3stream::PipelinedUploader::write(ChunkBuffer&& chunk)
{
    check_started_();

    // S3 counts parts from 1
    const auto part_number = next_part_number_++;
    std::optional<ChunkBuffer> buffer_to_recycle;

    // 1) If all workers are busy, block until one of them finishes.
    // 2) Otherwise, collect a finished job if there is one, just to reuse its
    //    buffer. This never blocks.
    if (in_flight_ == max_workers_) {
        auto result = job_results_.receive();
        if (!result) {
            throw IncompleteUploadError(
              LOG_ERROR("A part of object ",
                        object_key_,
                        " failed to upload; refusing part ",
                        part_number),
              parts_started_(),
              uploaded_parts_.size());
        }
        buffer_to_recycle = collect_(std::move(*result));
    } else if (jobs_finished_.load() > uploaded_parts_.size()) {
        if (auto result = job_results_.try_receive()) {
            buffer_to_recycle = collect_(std::move(*result));
        }
    }

    const bool pushed = thread_pool_->push_job(
      [this, part_number, chunk = std::move(chunk)](std::string& err) mutable {
          try {
              auto part = client_->upload_part(
                bucket_name_, object_key_, upload_id_, part_number, chunk);
              part.number = part_number;

              ++jobs_finished_;
              job_results_.send({ std::move(part), std::move(chunk) });
          } catch (const std::exception& exc) {
              job_results_.close();
              err = "Failed to upload part " + std::to_string(part_number) +
                    " of object " + object_key_ + ": " + exc.what();
              return false;
          }

          return true;
      });
    EXPECT(pushed, "Failed to schedule upload of part ", part_number);

    ++in_flight_;
    max_in_flight_ = std::max(max_in_flight_, in_flight_);

    return buffer_to_recycle;
}

void
s3stream::PipelinedUploader::close()
{
    check_started_();

    const auto n_parts = parts_started_();

    try {
        while (uploaded_parts_.size() < n_parts) {
            auto result = job_results_.receive();
            if (!result) {
                // let the remaining jobs finish before reporting
                stop_workers_();
                throw IncompleteUploadError(
                  LOG_ERROR("Multipart upload of object ",
                            object_key_,
                            " is incomplete: ",
                            uploaded_parts_.size(),
                            " of ",
                            n_parts,
                            " parts uploaded, ",
                            thread_pool_->n_jobs_failed(),
                            " failed"),
                  n_parts,
                  uploaded_parts_.size());
            }
            collect_(std::move(*result));
        }
        job_results_.close();

        // parts can finish out of order, but S3 expects them in order
        reorder_parts(uploaded_parts_);
        CHECK(parts_are_complete(uploaded_parts_));

        client_->complete_multipart_upload(
          bucket_name_, object_key_, upload_id_, uploaded_parts_);
    } catch (const std::exception&) {
        job_results_.close();
        stop_workers_();
        throw;
    }

    job_results_.close();
    stop_workers_();
}

s3stream::ChunkBuffer
s3stream::PipelinedUploader::collect_(JobResult&& result)
{
    --in_flight_;
    uploaded_parts_.push_back(std::move(result.part));

    return std::move(result.buffer);
}

size_t
s3stream::PipelinedUploader::parts_started_() const noexcept
{
    return next_part_number_ - 1;
}

void
s3stream::PipelinedUploader::stop_workers_() noexcept
{
    if (thread_pool_) {
        thread_pool_->await_stop();
    }
}
