#include "macros.hh"
#include "request.signer.hh"
#include "errors.hh"

#include <miniocpp/providers.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace {
constexpr std::array<std::string_view, 3> signature_headers{
    "authorization",
    "x-amz-content-sha256",
    "x-amz-date",
};

bool
iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string
get_env(const char* name)
{
    const char* value = std::getenv(name);
    return value ? value : "";
}
} // namespace

s3stream::Credentials
s3stream::Credentials::from_environment()
{
    Credentials credentials{
        .access_key_id = get_env("AWS_ACCESS_KEY_ID"),
        .secret_access_key = get_env("AWS_SECRET_ACCESS_KEY"),
        .session_token = get_env("AWS_SESSION_TOKEN"),
    };

    if (credentials.empty()) {
        throw ConfigurationError(
          LOG_ERROR("AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY must be set"));
    }

    return credentials;
}

bool
s3stream::Credentials::empty() const noexcept
{
    return access_key_id.empty() || secret_access_key.empty();
}

s3stream::RequestSigner::RequestSigner(Credentials credentials,
                                       std::string region)
  : credentials_{ std::move(credentials) }
  , region_{ std::move(region) }
{
    if (credentials_.empty()) {
        throw ConfigurationError(
          LOG_ERROR("Access key ID and secret access key must not be empty"));
    }
}

void
s3stream::RequestSigner::prepare(Headers& headers) const
{
    std::erase_if(headers, [](const auto& header) {
        return is_signature_header(header.first);
    });
}

s3stream::Headers
s3stream::RequestSigner::prepared(Headers headers) const
{
    prepare(headers);
    return headers;
}

std::unique_ptr<minio::creds::Provider>
s3stream::RequestSigner::make_provider() const
{
    return std::make_unique<minio::creds::StaticProvider>(
      credentials_.access_key_id,
      credentials_.secret_access_key,
      credentials_.session_token);
}

bool
s3stream::is_signature_header(std::string_view header)
{
    return std::any_of(
      signature_headers.begin(),
      signature_headers.end(),
      [header](std::string_view name) { return iequals(header, name); });
}
