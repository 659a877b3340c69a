#pragma once

#include "object.store.hh"
#include "s3.location.hh"

#include <cstddef> // size_t, std::byte
#include <vector>

namespace s3stream {
/// @brief A sealed, immutable block of bytes awaiting upload.
using Part = std::vector<std::byte>;

/// @brief How a finished object is sent to the store.
enum class UploadStrategy
{
    SimplePut, // one request carrying the whole object
    Multipart, // start a session, upload each part in order, complete
};

/**
 * @brief Choose how to upload a sequence of sealed parts.
 * @details A lone part smaller than @p min_part_size, or no part at all,
 * is sent with a simple put. Everything else goes through a multipart session.
 */
UploadStrategy
select_upload_strategy(const std::vector<Part>& parts, size_t min_part_size);

/**
 * @brief The finalized contents of an object, ready to be sent to the store
 * exactly once.
 * @details The upload strategy is fixed when the upload is constructed.
 */
class PartUpload
{
  public:
    PartUpload(S3Location location,
               std::vector<Part>&& parts,
               size_t bytes_written,
               size_t min_part_size);

    PartUpload(PartUpload&&) = default;
    PartUpload& operator=(PartUpload&&) = default;
    PartUpload(const PartUpload&) = delete;
    PartUpload& operator=(const PartUpload&) = delete;

    const S3Location& location() const;
    const std::vector<Part>& parts() const;
    UploadStrategy strategy() const;
    size_t bytes_written() const;

    /**
     * @brief Send every part to @p store using the selected strategy.
     * @details Parts are uploaded sequentially, in the order they were
     * written. Nothing is retried, and a partially uploaded multipart session
     * is left as-is on failure.
     * @param store The object store to upload to.
     * @return The total number of bytes uploaded.
     * @throws std::runtime_error naming the failed phase if any request fails.
     */
    [[nodiscard]] size_t execute(ObjectStore& store) &&;

  private:
    S3Location location_;
    std::vector<Part> parts_;
    size_t bytes_written_;
    UploadStrategy strategy_;

    void put_object_(ObjectStore& store);
    void upload_multipart_(ObjectStore& store);
};
} // namespace s3stream
