#pragma once

#include "object.store.hh"
#include "part.writer.hh"
#include "s3.credentials.hh"
#include "s3.location.hh"
#include "thread.pool.hh"

#include <future>
#include <memory>
#include <string_view>

namespace s3stream {
/**
 * @brief Buffers an object in memory and uploads it to S3 when finished.
 * @details write() and flush() never touch the network, so an S3Writer can
 * be driven from code that must not block on I/O. All requests are deferred
 * to finish(), which consumes the writer.
 */
class S3Writer
{
  public:
    /**
     * @brief Create a writer for the object at @p uri, building a client from
     * @p credentials.
     * @throws std::invalid_argument if @p uri is not a valid s3:// location.
     * @throws std::runtime_error if the client cannot be created.
     */
    S3Writer(std::string_view uri,
             const S3Credentials& credentials,
             const PartWriterConfig& config = {});

    S3Writer(S3Location location,
             std::shared_ptr<ObjectStore> store,
             const PartWriterConfig& config = {});

    size_t write(std::span<const std::byte> data);
    void flush();

    /// @brief The total number of bytes written so far.
    size_t bytes_written() const;

    const S3Location& location() const;

  private:
    S3Location location_;
    std::shared_ptr<ObjectStore> store_;
    PartWriter part_writer_;

    friend std::future<size_t> finish(std::unique_ptr<S3Writer>&& writer,
                                      ThreadPool& thread_pool);
};

/**
 * @brief Upload everything written to @p writer and complete the object.
 * @details The writer is consumed immediately and the upload runs as a job
 * on @p thread_pool.
 * @return A future holding the total number of bytes uploaded, or the
 * exception that caused the upload to fail.
 */
std::future<size_t>
finish(std::unique_ptr<S3Writer>&& writer, ThreadPool& thread_pool);
} // namespace s3stream
