#pragma once

#include "object.store.hh"
#include "s3.credentials.hh"

#include <miniocpp/client.h>

#include <memory>
#include <string>
#include <string_view>

namespace s3stream {
class S3Connection : public ObjectStore
{
  public:
    static constexpr std::string_view default_endpoint =
      "https://s3.amazonaws.com";
    static constexpr std::string_view default_region = "us-east-1";

    /**
     * @brief Build a client for the object store.
     * @details The endpoint and region fall back to the AWS defaults. If both
     * an access key ID and a secret access key are given, requests are signed
     * with them (and the session token, if any); otherwise requests are
     * anonymous.
     * @throws std::runtime_error if the client cannot be created.
     */
    explicit S3Connection(const S3Credentials& credentials);

    S3Connection(const S3Connection&) = delete;
    ~S3Connection() noexcept override = default;

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    [[nodiscard]] std::string put_object(std::string_view bucket_name,
                                         std::string_view object_name,
                                         std::span<std::byte> data) override;

    /**
     * @brief Delete an object.
     * @returns True if the object was successfully deleted, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    [[nodiscard]] bool delete_object(std::string_view bucket_name,
                                     std::string_view object_name);

    /* Multipart object operations */

    [[nodiscard]] std::string create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name) override;

    [[nodiscard]] std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      std::span<std::byte> data,
      unsigned int part_number) override;

    [[nodiscard]] bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::vector<UploadedPart>& parts) override;

  private:
    std::unique_ptr<minio::s3::BaseUrl> url_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
    std::unique_ptr<minio::s3::Client> client_;
};
} // namespace s3stream
