#pragma once

#include "part.upload.hh"

#include <cstddef> // size_t, std::byte
#include <span>    // std::span
#include <vector>

namespace s3stream {
struct PartWriterConfig
{
    /// Minimum size AWS S3 accepts for a multipart part, except the last one.
    static constexpr size_t default_min_part_size = 5 << 20;
    static constexpr size_t default_split_threshold = 32 << 20;

    size_t split_threshold{ default_split_threshold };
    size_t min_part_size{ default_min_part_size };
};

/**
 * @brief Accumulates bytes in memory and seals them into parts of at least
 * the split threshold.
 * @details A PartWriter never performs I/O. Once all data has been written,
 * it is consumed by into_upload(), which hands the sealed parts to a
 * PartUpload.
 */
class PartWriter
{
  public:
    /**
     * @throws std::runtime_error if the split threshold or minimum part size
     * is zero.
     */
    explicit PartWriter(const PartWriterConfig& config = {});

    PartWriter(PartWriter&&) = default;
    PartWriter(const PartWriter&) = delete;

    /**
     * @brief Append @p data to the in-progress part, sealing the part if it
     * has reached the split threshold.
     * @return The number of bytes accepted, which is always data.size().
     */
    size_t write(std::span<const std::byte> data);

    /// No-op. Nothing is sent until the upload is executed.
    void flush();

    /// @brief The total number of bytes ever written.
    size_t bytes_written() const;

    /// @brief The number of bytes in the in-progress, unsealed part.
    size_t buffered_bytes() const;

    /// @brief The parts sealed so far, in write order.
    const std::vector<Part>& parts() const;

    /**
     * @brief Seal any buffered bytes as the final part and convert this
     * writer into an upload to @p location.
     */
    [[nodiscard]] PartUpload into_upload(S3Location location) &&;

  private:
    PartWriterConfig config_;

    Part buffer_;
    std::vector<Part> parts_;
    size_t bytes_written_{ 0 };
};
} // namespace s3stream
