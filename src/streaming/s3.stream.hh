#pragma once

#include "s3stream.h"
#include "s3.writer.hh"
#include "thread.pool.hh"

#include <cstddef> // size_t
#include <memory>  // unique_ptr

struct S3Stream_s
{
  public:
    S3Stream_s(struct S3StreamSettings_s* settings);
    ~S3Stream_s() = default;

    /**
     * @brief Append data to the stream.
     * @param data The data to append.
     * @param nbytes The number of bytes to append.
     * @return The number of bytes appended.
     */
    size_t write(const void* data, size_t nbytes);

    void flush();

    size_t bytes_written() const;

    /**
     * @brief Upload all data written so far and wait for the upload to
     * complete.
     * @return The number of bytes uploaded.
     * @throws std::runtime_error if the upload fails.
     */
    size_t finish();

  private:
    std::unique_ptr<s3stream::S3Writer> writer_;

    // declared last so it is destroyed, and its jobs drained, first
    s3stream::ThreadPool thread_pool_;
};
