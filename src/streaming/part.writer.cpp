#include "macros.hh"
#include "part.writer.hh"

s3stream::PartWriter::PartWriter(const PartWriterConfig& config)
  : config_{ config }
{
    EXPECT(config_.split_threshold > 0, "Split threshold must be positive");
    EXPECT(config_.min_part_size > 0, "Minimum part size must be positive");

    if (config_.split_threshold < config_.min_part_size) {
        LOG_WARNING("Split threshold ",
                    config_.split_threshold,
                    " is below the minimum part size ",
                    config_.min_part_size,
                    "; multipart uploads may be rejected");
    }

    buffer_.reserve(config_.min_part_size);
}

size_t
s3stream::PartWriter::write(std::span<const std::byte> data)
{
    bytes_written_ += data.size();
    buffer_.insert(buffer_.end(), data.begin(), data.end());

    if (buffer_.size() >= config_.split_threshold) {
        LOG_DEBUG("Sealing part ", parts_.size() + 1, ": ", buffer_.size(), " bytes");

        Part part;
        part.reserve(config_.split_threshold);
        part.swap(buffer_);
        parts_.push_back(std::move(part));
    }

    return data.size();
}

void
s3stream::PartWriter::flush()
{
}

size_t
s3stream::PartWriter::bytes_written() const
{
    return bytes_written_;
}

size_t
s3stream::PartWriter::buffered_bytes() const
{
    return buffer_.size();
}

const std::vector<s3stream::Part>&
s3stream::PartWriter::parts() const
{
    return parts_;
}

s3stream::PartUpload
s3stream::PartWriter::into_upload(S3Location location) &&
{
    if (!buffer_.empty()) {
        parts_.push_back(std::move(buffer_));
        buffer_.clear();
    }

    return { std::move(location),
             std::move(parts_),
             bytes_written_,
             config_.min_part_size };
}
