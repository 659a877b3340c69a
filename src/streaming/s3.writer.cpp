#include "macros.hh"
#include "s3.connection.hh"
#include "s3.writer.hh"

s3stream::S3Writer::S3Writer(std::string_view uri,
                             const S3Credentials& credentials,
                             const PartWriterConfig& config)
  : location_{ S3Location::parse(uri) }
  , part_writer_{ config }
{
    LOG_DEBUG("Creating S3 streaming writer for bucket: ",
              location_.bucket_name,
              ", path: ",
              location_.object_key);

    try {
        store_ = std::make_shared<S3Connection>(credentials);
    } catch (const std::exception& exc) {
        throw std::runtime_error(
          LOG_ERROR("Failed to create S3 client: ", exc.what()));
    }

    LOG_INFO("S3 streaming writer created successfully for bucket: ",
             location_.bucket_name);
}

s3stream::S3Writer::S3Writer(S3Location location,
                             std::shared_ptr<ObjectStore> store,
                             const PartWriterConfig& config)
  : location_{ std::move(location) }
  , store_{ std::move(store) }
  , part_writer_{ config }
{
    EXPECT(!location_.bucket_name.empty(), "Bucket name must not be empty");
    EXPECT(!location_.object_key.empty(), "Object key must not be empty");
    EXPECT(store_, "Null pointer: store");
}

size_t
s3stream::S3Writer::write(std::span<const std::byte> data)
{
    return part_writer_.write(data);
}

void
s3stream::S3Writer::flush()
{
    part_writer_.flush();
}

size_t
s3stream::S3Writer::bytes_written() const
{
    return part_writer_.bytes_written();
}

const s3stream::S3Location&
s3stream::S3Writer::location() const
{
    return location_;
}

std::future<size_t>
s3stream::finish(std::unique_ptr<S3Writer>&& writer, ThreadPool& thread_pool)
{
    auto promise = std::make_shared<std::promise<size_t>>();
    auto future = promise->get_future();

    if (writer == nullptr) {
        promise->set_exception(std::make_exception_ptr(
          std::runtime_error(LOG_ERROR("Null pointer: writer"))));
        return future;
    }

    auto store = std::move(writer->store_);
    auto upload = std::make_shared<PartUpload>(
      std::move(writer->part_writer_).into_upload(std::move(writer->location_)));
    writer.reset();

    auto job = [store, upload, promise](std::string& err) {
        try {
            promise->set_value(std::move(*upload).execute(*store));
        } catch (const std::exception& exc) {
            err = exc.what();
            promise->set_exception(std::current_exception());
            return false;
        }
        return true;
    };

    if (!thread_pool.push_job(std::move(job))) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error(
          LOG_ERROR("Failed to schedule upload: thread pool is stopped"))));
    }

    return future;
}
