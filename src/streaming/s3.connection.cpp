#include "macros.hh"
#include "s3.connection.hh"
#include "errors.hh"

#include <miniocpp/client.h>

#include <list>

namespace {
bool
is_credential_error(const std::string& code)
{
    return code == "ExpiredToken" || code == "InvalidToken" ||
           code == "TokenRefreshRequired";
}

[[noreturn]] void
throw_response_error(const minio::s3::Response& response,
                     const std::string& message)
{
    const std::string what =
      LOG_ERROR(message, ": ", response.Error().String());

    if (is_credential_error(response.code)) {
        throw s3stream::CredentialExpiredError(what, response.code);
    }
    throw s3stream::ServerError(what, response.code);
}

minio::utils::Multimap
to_multimap(const s3stream::Headers& headers)
{
    minio::utils::Multimap multimap;
    for (const auto& [key, value] : headers) {
        multimap.Add(key, value);
    }
    return multimap;
}
} // namespace

s3stream::S3Connection::S3Connection(std::string_view endpoint,
                                     const RequestSigner& signer)
  : signer_{ signer }
{
    EXPECT(!endpoint.empty(), "Endpoint must not be empty.");

    minio::s3::BaseUrl url{ std::string(endpoint) };
    url.https = endpoint.starts_with("https");
    if (!signer_.region().empty()) {
        url.region = signer_.region();
    }

    provider_ = signer_.make_provider();
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

s3stream::S3Connection::~S3Connection() noexcept
{
    close();
}

bool
s3stream::S3Connection::check_connection()
{
    return static_cast<bool>(client_or_throw_().ListBuckets());
}

bool
s3stream::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT_SETTING(!bucket_name.empty(), "Bucket name must not be empty");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_or_throw_().BucketExists(args);
    return response.exist;
}

bool
s3stream::S3Connection::object_exists(std::string_view bucket_name,
                                      std::string_view object_name)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);

    minio::s3::StatObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_or_throw_().StatObject(args);
    // casts to true if response code in 200 range and error message is empty
    return static_cast<bool>(response);
}

bool
s3stream::S3Connection::delete_object(std::string_view bucket_name,
                                      std::string_view object_name)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);

    LOG_DEBUG("Deleting object ", object_name, " from bucket ", bucket_name);
    minio::s3::RemoveObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_or_throw_().RemoveObject(args);
    if (!response) {
        LOG_ERROR("Failed to delete object ",
                  object_name,
                  " from bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

std::string
s3stream::S3Connection::create_multipart_object(std::string_view bucket_name,
                                                std::string_view object_name,
                                                const Headers& headers)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);

    LOG_DEBUG(
      "Creating multipart object ", object_name, " in bucket ", bucket_name);

    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.headers = to_multimap(signer_.prepared(headers));

    auto response = client_or_throw_().CreateMultipartUpload(args);
    if (!response) {
        throw_response_error(response,
                             "Failed to create multipart object " +
                               std::string(object_name) + " in bucket " +
                               std::string(bucket_name));
    }
    EXPECT(!response.upload_id.empty(), "Upload id returned empty.");

    return response.upload_id;
}

s3stream::Part
s3stream::S3Connection::upload_multipart_object_part(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  std::span<const std::byte> data,
  unsigned int part_number)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(part_number, "Part number must be positive.");

    LOG_DEBUG("Uploading multipart object part ",
              part_number,
              " (",
              data.size(),
              " bytes) for object ",
              object_name,
              " in bucket ",
              bucket_name);

    std::string_view data_buffer(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = data_buffer;

    auto response = client_or_throw_().UploadPart(args);
    if (!response) {
        throw_response_error(response,
                             "Failed to upload part " +
                               std::to_string(part_number) + " for object " +
                               std::string(object_name) + " in bucket " +
                               std::string(bucket_name));
    }

    return { .number = part_number, .etag = response.etag };
}

s3stream::CompletedUpload
s3stream::S3Connection::complete_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::vector<Part>& parts)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(!parts.empty(), "Parts list must not be empty.");

    LOG_DEBUG("Completing multipart object ",
              object_name,
              " in bucket ",
              bucket_name,
              " with ",
              parts.size(),
              " parts");

    std::list<minio::s3::Part> minio_parts;
    for (const auto& part : parts) {
        minio::s3::Part minio_part;
        minio_part.number = part.number;
        minio_part.etag = part.etag;
        minio_parts.push_back(minio_part);
    }

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;
    args.parts = minio_parts;

    auto response = client_or_throw_().CompleteMultipartUpload(args);
    if (!response) {
        throw_response_error(response,
                             "Failed to complete multipart object " +
                               std::string(object_name) + " in bucket " +
                               std::string(bucket_name));
    }

    return { .key = std::string(object_name), .etag = response.etag };
}

bool
s3stream::S3Connection::abort_multipart_object(std::string_view bucket_name,
                                               std::string_view object_name,
                                               std::string_view upload_id)
{
    EXPECT_OBJECT_TARGET(bucket_name, object_name);
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");

    LOG_DEBUG(
      "Aborting multipart object ", object_name, " in bucket ", bucket_name);
    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;

    auto response = client_or_throw_().AbortMultipartUpload(args);
    if (!response) {
        LOG_ERROR("Failed to abort multipart object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

void
s3stream::S3Connection::close() noexcept
{
    client_.reset();
    provider_.reset();
}

minio::s3::Client&
s3stream::S3Connection::client_or_throw_()
{
    EXPECT(client_, "Connection is closed.");
    return *client_;
}
