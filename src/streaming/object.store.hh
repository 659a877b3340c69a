#pragma once

#include <cstddef> // size_t, std::byte
#include <span>    // std::span
#include <string>
#include <string_view>
#include <vector>

namespace s3stream {
/// @brief A part of a multipart object that has been accepted by the store.
struct UploadedPart
{
    unsigned int number; // 1-based
    std::string etag;
    size_t size;
};

/**
 * @brief The subset of object-store operations needed to upload one object,
 * either in a single request or as a multipart session.
 * @details Failures are reported through empty return values and are
 * expected to be logged by the implementation, with the provider's error
 * message.
 */
class ObjectStore
{
  public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Put an object in a single request.
     * @param bucket_name The name of the bucket to put the object in.
     * @param object_name The name of the object.
     * @param data The data to put in the object. May be empty.
     * @returns The etag of the object. Nonempty if and only if the operation
     * succeeds.
     */
    [[nodiscard]] virtual std::string put_object(std::string_view bucket_name,
                                                 std::string_view object_name,
                                                 std::span<std::byte> data) = 0;

    /**
     * @brief Start a multipart upload session.
     * @returns The upload id of the session. Nonempty if and only if the
     * operation succeeds.
     */
    [[nodiscard]] virtual std::string create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name) = 0;

    /**
     * @brief Upload one part of a multipart object.
     * @param part_number The 1-based number of the part.
     * @returns The etag of the uploaded part. Nonempty if and only if the
     * operation succeeds.
     */
    [[nodiscard]] virtual std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      std::span<std::byte> data,
      unsigned int part_number) = 0;

    /**
     * @brief Complete a multipart upload session.
     * @param parts The uploaded parts, in part-number order.
     * @returns True if the object was successfully completed, otherwise false.
     */
    [[nodiscard]] virtual bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::vector<UploadedPart>& parts) = 0;
};
} // namespace s3stream
