#include "macros.hh"
#include "part.upload.hh"

s3stream::UploadStrategy
s3stream::select_upload_strategy(const std::vector<Part>& parts,
                                 size_t min_part_size)
{
    // an empty object has no parts and can't be sent as a multipart session
    if (parts.empty()) {
        return UploadStrategy::SimplePut;
    }

    if (parts.size() == 1 && parts.front().size() < min_part_size) {
        return UploadStrategy::SimplePut;
    }

    return UploadStrategy::Multipart;
}

s3stream::PartUpload::PartUpload(S3Location location,
                                 std::vector<Part>&& parts,
                                 size_t bytes_written,
                                 size_t min_part_size)
  : location_{ std::move(location) }
  , parts_{ std::move(parts) }
  , bytes_written_{ bytes_written }
  , strategy_{ select_upload_strategy(parts_, min_part_size) }
{
}

const s3stream::S3Location&
s3stream::PartUpload::location() const
{
    return location_;
}

const std::vector<s3stream::Part>&
s3stream::PartUpload::parts() const
{
    return parts_;
}

s3stream::UploadStrategy
s3stream::PartUpload::strategy() const
{
    return strategy_;
}

size_t
s3stream::PartUpload::bytes_written() const
{
    return bytes_written_;
}

size_t
s3stream::PartUpload::execute(ObjectStore& store) &&
{
    LOG_DEBUG("Completing S3 upload of ",
              location_.to_uri(),
              ": ",
              bytes_written_,
              " bytes total");

    switch (strategy_) {
        case UploadStrategy::SimplePut:
            put_object_(store);
            LOG_INFO("Successfully uploaded ",
                     bytes_written_,
                     " bytes to ",
                     location_.to_uri());
            break;
        case UploadStrategy::Multipart:
            upload_multipart_(store);
            LOG_INFO("Successfully uploaded ",
                     bytes_written_,
                     " bytes to ",
                     location_.to_uri(),
                     " using multipart upload");
            break;
    }

    parts_.clear();
    return bytes_written_;
}

void
s3stream::PartUpload::put_object_(ObjectStore& store)
{
    Part empty;
    Part& data = parts_.empty() ? empty : parts_.front();

    LOG_DEBUG("Using simple PUT for small object: ", data.size(), " bytes");

    const std::string etag =
      store.put_object(location_.bucket_name, location_.object_key, data);
    EXPECT(!etag.empty(),
           "Failed to upload ",
           data.size(),
           " bytes to ",
           location_.to_uri());
}

void
s3stream::PartUpload::upload_multipart_(ObjectStore& store)
{
    const auto& bucket = location_.bucket_name;
    const auto& key = location_.object_key;

    LOG_DEBUG("Starting multipart upload for ", parts_.size(), " parts");
    const std::string upload_id = store.create_multipart_object(bucket, key);
    EXPECT(!upload_id.empty(),
           "Failed to start multipart upload of ",
           location_.to_uri());

    std::vector<UploadedPart> uploaded;
    uploaded.reserve(parts_.size());

    for (auto i = 0u; i < parts_.size(); ++i) {
        auto& data = parts_[i];
        const unsigned int part_number = i + 1;

        LOG_DEBUG(
          "Uploading part ", part_number, " (", data.size(), " bytes)");
        std::string etag = store.upload_multipart_object_part(
          bucket, key, upload_id, data, part_number);
        EXPECT(!etag.empty(),
               "Failed to upload part ",
               part_number,
               " of ",
               parts_.size(),
               " (",
               data.size(),
               " bytes) of ",
               location_.to_uri());

        uploaded.push_back({ .number = part_number,
                             .etag = std::move(etag),
                             .size = data.size() });

        // the store has its own copy now
        Part().swap(data);
    }

    EXPECT(store.complete_multipart_object(bucket, key, upload_id, uploaded),
           "Failed to complete multipart upload of ",
           location_.to_uri(),
           " with ",
           uploaded.size(),
           " parts");
}
