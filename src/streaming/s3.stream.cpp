#include "macros.hh"
#include "s3.stream.hh"
#include "s3stream.h"
#include "errors.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <optional>
#include <span>

namespace {
[[nodiscard]]
std::string
trim(const char* s)
{
    if (s == nullptr || *s == '\0') {
        return {};
    }

    const size_t length = strlen(s);

    // trim left
    std::string trimmed(s, length);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
is_empty_string(const char* s, std::string_view error_msg)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(error_msg);
        return true;
    }
    return false;
}

/// Parse the custom headers, a JSON object of strings. Empty is fine.
[[nodiscard]]
std::optional<s3stream::Headers>
parse_custom_headers(const char* headers)
{
    s3stream::Headers parsed;
    if (headers == nullptr || !*headers) {
        return parsed;
    }

    auto val = nlohmann::json::parse(headers,
                                     nullptr, // callback
                                     false,   // allow exceptions
                                     true     // ignore comments
    );

    if (val.is_discarded()) {
        LOG_ERROR("Invalid JSON: ", headers);
        return std::nullopt;
    }

    if (!val.is_object()) {
        LOG_ERROR("Custom headers must be a JSON object: ", headers);
        return std::nullopt;
    }

    for (const auto& [name, value] : val.items()) {
        if (name.empty()) {
            LOG_ERROR("Custom header name is empty");
            return std::nullopt;
        }
        if (!value.is_string()) {
            LOG_ERROR("Value of custom header '", name, "' is not a string");
            return std::nullopt;
        }
        parsed.emplace(name, value.get<std::string>());
    }

    return parsed;
}

[[nodiscard]]
bool
validate_settings(const struct S3StreamSettings_s* settings)
{
    if (!settings) {
        LOG_ERROR("Null pointer: settings");
        return false;
    }

    std::string trimmed = trim(settings->endpoint);
    if (trimmed.empty()) {
        LOG_ERROR("S3 endpoint is empty");
        return false;
    }
    if (!trimmed.starts_with("http://") && !trimmed.starts_with("https://")) {
        LOG_ERROR("Invalid endpoint: ",
                  settings->endpoint,
                  ". Must start with http:// or https://");
        return false;
    }

    // https://docs.aws.amazon.com/AmazonS3/latest/userguide/bucketnamingrules.html
    trimmed = trim(settings->bucket_name);
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        LOG_ERROR("Invalid length for S3 bucket name: ",
                  trimmed.length(),
                  ". Must be between 3 and 63 characters");
        return false;
    }

    if (is_empty_string(settings->object_key, "S3 object key is empty") ||
        is_empty_string(settings->access_key_id, "S3 access key ID is empty") ||
        is_empty_string(settings->secret_access_key,
                        "S3 secret access key is empty")) {
        return false;
    }

    if (settings->part_size != 0 &&
        settings->part_size < S3STREAM_MINIMUM_PART_SIZE) {
        LOG_ERROR("Invalid part size: ",
                  settings->part_size,
                  ". Must be at least ",
                  S3STREAM_MINIMUM_PART_SIZE,
                  " bytes");
        return false;
    }

    if (settings->max_workers > S3STREAM_MAXIMUM_MAX_WORKERS) {
        LOG_ERROR("Invalid max_workers: ",
                  settings->max_workers,
                  ". Must be at most ",
                  S3STREAM_MAXIMUM_MAX_WORKERS);
        return false;
    }

    if (!parse_custom_headers(settings->custom_headers)) {
        return false;
    }

    return true;
}
} // namespace

static_assert(S3STREAM_MINIMUM_PART_SIZE ==
              s3stream::S3Client::minimum_part_size);
static_assert(S3STREAM_MAXIMUM_MAX_WORKERS ==
              s3stream::S3Client::maximum_workers);

/* S3Stream_s implementation */

S3Stream_s::S3Stream_s(const struct S3StreamSettings_s* settings)
  : state_{ State::Open }
  , parts_dispatched_{ 0 }
  , uploader_{ nullptr }
{
    if (!validate_settings(settings)) {
        throw s3stream::ConfigurationError("Invalid S3 stream settings");
    }

    bucket_name_ = trim(settings->bucket_name);
    object_key_ = trim(settings->object_key);

    s3stream::S3ClientSettings client_settings{
        .endpoint = trim(settings->endpoint),
        .region = trim(settings->region),
        .credentials = { .access_key_id = trim(settings->access_key_id),
                         .secret_access_key =
                           trim(settings->secret_access_key),
                         .session_token = trim(settings->session_token) },
        .lazy_init = true,
    };
    client_ = std::make_shared<s3stream::S3Client>(std::move(client_settings));

    // max_workers is at most S3STREAM_MAXIMUM_MAX_WORKERS here
    open_({
      .part_size = settings->part_size == 0 ? S3STREAM_MINIMUM_PART_SIZE
                                            : settings->part_size,
      .max_workers = settings->max_workers == 0
                       ? S3STREAM_DEFAULT_MAX_WORKERS
                       : static_cast<unsigned int>(settings->max_workers),
      .headers = *parse_custom_headers(settings->custom_headers),
      .pipelined = !settings->serial,
    });
}

S3Stream_s::S3Stream_s(std::shared_ptr<s3stream::StorageClient> client,
                       std::string_view bucket_name,
                       std::string_view object_key,
                       const s3stream::StreamUploadOptions& options)
  : bucket_name_{ bucket_name }
  , object_key_{ object_key }
  , state_{ State::Open }
  , parts_dispatched_{ 0 }
  , client_{ std::move(client) }
  , uploader_{ nullptr }
{
    EXPECT_SETTING(client_, "Null pointer: client");
    open_(options);
}

S3Stream_s::~S3Stream_s()
{
    if (state_ != State::Open) {
        return;
    }

    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("Error finalizing S3 stream: ", e.what());
    }
}

size_t
S3Stream_s::append(const void* data, size_t nbytes)
{
    if (state_ == State::Aborted) {
        throw_aborted_();
    }
    if (state_ == State::Closed) {
        throw s3stream::StreamClosedError();
    }

    if (nbytes == 0) {
        return 0;
    }
    EXPECT(data != nullptr, "Null pointer: data");

    try {
        stream_->write(
          { static_cast<const std::byte*>(data), nbytes });
    } catch (const std::exception& e) {
        abort_(e.what());
        throw;
    }

    return nbytes;
}

void
S3Stream_s::close()
{
    if (state_ == State::Aborted) {
        throw_aborted_();
    }
    if (state_ == State::Closed) {
        return;
    }

    try {
        stream_->close();
    } catch (const std::exception& e) {
        abort_(e.what());
        throw;
    }
    state_ = State::Closed;

    LOG_INFO("Uploaded ",
             stream_->bytes_written(),
             " bytes to ",
             bucket_name_,
             "/",
             object_key_,
             " in ",
             stream_->chunks_dispatched(),
             " part(s)");
}

void
S3Stream_s::open_(const s3stream::StreamUploadOptions& options)
{
    auto uploader =
      s3stream::make_uploader(client_, bucket_name_, object_key_, options);
    uploader_ = uploader.get();
    stream_ = std::make_unique<s3stream::ChunkedStream>(options.part_size,
                                                        std::move(uploader));
}

void
S3Stream_s::abort_(const std::string& reason) noexcept
{
    state_ = State::Aborted;
    failure_ = reason;

    const std::string upload_id = uploader_ ? uploader_->upload_id() : "";
    parts_dispatched_ = stream_ ? stream_->chunks_dispatched() : 0;

    // waits for any parts still in flight
    stream_.reset();
    uploader_ = nullptr;

    if (upload_id.empty()) {
        return;
    }

    LOG_WARNING("Aborting upload of ", object_key_, ": ", reason);
    try {
        if (!client_->abort_multipart_upload(
              bucket_name_, object_key_, upload_id)) {
            LOG_ERROR("Failed to abort multipart upload ", upload_id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(
          "Failed to abort multipart upload ", upload_id, ": ", e.what());
    }
}

void
S3Stream_s::throw_aborted_() const
{
    // an aborted upload keeps none of its parts
    throw s3stream::IncompleteUploadError(
      LOG_ERROR("Upload of ", object_key_, " was aborted: ", failure_),
      parts_dispatched_,
      0);
}
