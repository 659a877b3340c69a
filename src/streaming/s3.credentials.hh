#pragma once

#include <optional>
#include <string>

namespace s3stream {
/**
 * @brief Connection settings for the object store. An absent field means
 * "use the provider default".
 */
struct S3Credentials
{
    std::optional<std::string> access_key_id;
    std::optional<std::string> secret_access_key;
    std::optional<std::string> region;
    std::optional<std::string> session_token;
    std::optional<std::string> endpoint;

    /**
     * @brief Read settings from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY,
     * AWS_REGION, AWS_SESSION_TOKEN, and AWS_ENDPOINT. Unset or blank
     * variables are left absent.
     */
    static S3Credentials from_environment();

    /**
     * @brief Return a copy of these settings in which every field present in
     * @p overrides replaces the corresponding field here.
     */
    [[nodiscard]] S3Credentials merge(const S3Credentials& overrides) const;

    /// @brief True if both an access key ID and a secret access key are set.
    bool has_static_credentials() const;
};
} // namespace s3stream
