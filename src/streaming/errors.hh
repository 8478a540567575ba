#pragma once

#include <cstddef> // size_t
#include <stdexcept>
#include <string>
#include <utility> // std::move

namespace s3stream {
/// Base class of every error raised by the upload engine.
class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Invalid options, e.g., a part size below the S3 minimum. Never retried.
class ConfigurationError : public Error
{
  public:
    using Error::Error;
};

/// Write or flush on a stream that has already been closed.
class StreamClosedError : public Error
{
  public:
    StreamClosedError()
      : Error("Stream is closed")
    {
    }
};

/// The operation is not supported by this object, e.g., reading from a
/// write-only stream.
class UnsupportedOperationError : public Error
{
  public:
    using Error::Error;
};

/// A storage request failed.
class ServerError : public Error
{
  public:
    ServerError(const std::string& what, std::string code)
      : Error(what)
      , code_{ std::move(code) }
    {
    }

    /// The S3 error code, e.g., "NoSuchUpload". May be empty for transport
    /// failures.
    const std::string& code() const noexcept { return code_; }

  private:
    std::string code_;
};

/// The credentials used to sign a request have expired. The client façade
/// retries the failed operation once with refreshed credentials.
class CredentialExpiredError : public ServerError
{
  public:
    using ServerError::ServerError;
};

/// At least one part of a multipart upload was lost. The upload was not
/// completed; the caller should abort it.
class IncompleteUploadError : public Error
{
  public:
    IncompleteUploadError(const std::string& what,
                          size_t parts_expected,
                          size_t parts_uploaded)
      : Error(what)
      , parts_expected_{ parts_expected }
      , parts_uploaded_{ parts_uploaded }
    {
    }

    size_t parts_expected() const noexcept { return parts_expected_; }
    size_t parts_uploaded() const noexcept { return parts_uploaded_; }

  private:
    size_t parts_expected_;
    size_t parts_uploaded_;
};
} // namespace s3stream
