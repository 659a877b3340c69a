#include "s3.credentials.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace {
[[nodiscard]]
std::string
trim(std::string_view s)
{
    const auto not_space = [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    };

    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), not_space));
    trimmed.erase(
      std::find_if(trimmed.rbegin(), trimmed.rend(), not_space).base(),
      trimmed.end());

    return trimmed;
}

std::optional<std::string>
get_env(const char* name)
{
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }

    auto value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }

    return value;
}
} // namespace

s3stream::S3Credentials
s3stream::S3Credentials::from_environment()
{
    return S3Credentials{
        .access_key_id = get_env("AWS_ACCESS_KEY_ID"),
        .secret_access_key = get_env("AWS_SECRET_ACCESS_KEY"),
        .region = get_env("AWS_REGION"),
        .session_token = get_env("AWS_SESSION_TOKEN"),
        .endpoint = get_env("AWS_ENDPOINT"),
    };
}

s3stream::S3Credentials
s3stream::S3Credentials::merge(const S3Credentials& overrides) const
{
    S3Credentials merged = *this;
    if (overrides.access_key_id) {
        merged.access_key_id = overrides.access_key_id;
    }
    if (overrides.secret_access_key) {
        merged.secret_access_key = overrides.secret_access_key;
    }
    if (overrides.region) {
        merged.region = overrides.region;
    }
    if (overrides.session_token) {
        merged.session_token = overrides.session_token;
    }
    if (overrides.endpoint) {
        merged.endpoint = overrides.endpoint;
    }

    return merged;
}

bool
s3stream::S3Credentials::has_static_credentials() const
{
    return access_key_id.has_value() && secret_access_key.has_value();
}
