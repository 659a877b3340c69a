#include "macros.hh"
#include "s3.stream.hh"
#include "s3stream.h"

#include <cstring>

namespace {
[[nodiscard]]
std::optional<std::string>
copy_optional(const char* s)
{
    if (s == nullptr || *s == '\0') {
        return std::nullopt;
    }

    return std::string(s);
}

[[nodiscard]]
bool
validate_settings(const struct S3StreamSettings_s* settings)
{
    if (!settings) {
        LOG_ERROR("Null pointer: settings");
        return false;
    }

    if (settings->uri == nullptr) {
        LOG_ERROR("Null pointer: uri");
        return false;
    }

    if (std::strlen(settings->uri) == 0) {
        LOG_ERROR("URI is empty");
        return false;
    }

    return true;
}

s3stream::S3Credentials
make_credentials(const S3StreamCredentials* overrides)
{
    auto credentials = s3stream::S3Credentials::from_environment();
    if (overrides == nullptr) {
        return credentials;
    }

    return credentials.merge({
      .access_key_id = copy_optional(overrides->access_key_id),
      .secret_access_key = copy_optional(overrides->secret_access_key),
      .region = copy_optional(overrides->region),
      .session_token = copy_optional(overrides->session_token),
      .endpoint = copy_optional(overrides->endpoint),
    });
}
} // namespace

/* S3Stream_s implementation */

S3Stream_s::S3Stream_s(struct S3StreamSettings_s* settings)
  : thread_pool_{ 1, [](const std::string& err) {
                     LOG_ERROR("Upload failed: ", err);
                 } }
{
    if (!validate_settings(settings)) {
        throw std::invalid_argument("Invalid S3 stream settings");
    }

    s3stream::PartWriterConfig config;
    if (settings->split_threshold_bytes > 0) {
        config.split_threshold = settings->split_threshold_bytes;
    }

    writer_ = std::make_unique<s3stream::S3Writer>(
      settings->uri, make_credentials(settings->credentials), config);
}

size_t
S3Stream_s::write(const void* data, size_t nbytes)
{
    std::span buf(static_cast<const std::byte*>(data), nbytes);
    return writer_->write(buf);
}

void
S3Stream_s::flush()
{
    writer_->flush();
}

size_t
S3Stream_s::bytes_written() const
{
    return writer_->bytes_written();
}

size_t
S3Stream_s::finish()
{
    auto future = s3stream::finish(std::move(writer_), thread_pool_);

    return future.get();
}
