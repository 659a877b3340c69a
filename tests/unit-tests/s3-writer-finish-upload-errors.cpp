#include "mock.object.store.hh"
#include "s3.writer.hh"
#include "unit.test.macros.hh"

#include <algorithm>
#include <vector>

using s3stream::test::MockObjectStore;
using Operation = MockObjectStore::Operation;

namespace {
constexpr size_t KiB = 1 << 10;

const s3stream::S3Location location{ .bucket_name = "my-bucket",
                                     .object_key = "key" };

std::unique_ptr<s3stream::S3Writer>
make_writer(std::shared_ptr<MockObjectStore> store, size_t nbytes)
{
    auto writer = std::make_unique<s3stream::S3Writer>(
      location,
      std::move(store),
      s3stream::PartWriterConfig{ .split_threshold = 64 * KiB,
                                  .min_part_size = 64 * KiB });

    // write in slices so that parts are sealed at exactly the threshold
    std::vector<std::byte> slice(8 * KiB, std::byte{ 0x2a });
    while (nbytes > 0) {
        const auto n = std::min(nbytes, slice.size());
        writer->write({ slice.data(), n });
        nbytes -= n;
    }

    return writer;
}

/// Finish the upload and return the error message, or an empty string if
/// the upload succeeded.
std::string
finish_with_error(std::unique_ptr<s3stream::S3Writer>&& writer,
                  s3stream::ThreadPool& thread_pool)
{
    auto future = s3stream::finish(std::move(writer), thread_pool);
    try {
        future.get();
    } catch (const std::runtime_error& exc) {
        return exc.what();
    }

    return {};
}

bool
contains(const std::string& haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}

void
check_simple_put_fails(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<MockObjectStore>();
    store->fail_operation = Operation::PutObject;

    const auto err = finish_with_error(make_writer(store, 100), thread_pool);
    EXPECT(contains(err, "Failed to upload 100 bytes"),
           "Unexpected error message: ",
           err);
    CHECK(store->objects.empty());
}

void
check_session_start_fails(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<MockObjectStore>();
    store->fail_operation = Operation::CreateMultipart;

    const auto err =
      finish_with_error(make_writer(store, 200 * KiB), thread_pool);
    EXPECT(contains(err, "Failed to start multipart upload"),
           "Unexpected error message: ",
           err);

    // nothing was uploaded after the failure
    EXPECT_EQ(size_t, store->count(Operation::UploadPart), 0);
    EXPECT_EQ(size_t, store->count(Operation::CompleteMultipart), 0);
    CHECK(store->objects.empty());
}

void
check_part_upload_fails(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<MockObjectStore>();
    store->fail_operation = Operation::UploadPart;
    store->fail_part_number = 2;

    // parts: 64 KiB, 64 KiB, 64 KiB, 8 KiB
    const auto err =
      finish_with_error(make_writer(store, 200 * KiB), thread_pool);
    EXPECT(contains(err, "Failed to upload part 2 of 4 (65536 bytes)"),
           "Unexpected error message: ",
           err);

    // no retry, no further parts, no completion
    EXPECT_EQ(size_t, store->count(Operation::UploadPart), 2);
    EXPECT_EQ(size_t, store->count(Operation::CompleteMultipart), 0);
    CHECK(store->objects.empty());

    // the session is not aborted
    EXPECT_EQ(size_t, store->pending_uploads(), 1);
}

void
check_completion_fails(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<MockObjectStore>();
    store->fail_operation = Operation::CompleteMultipart;

    const auto err =
      finish_with_error(make_writer(store, 128 * KiB), thread_pool);
    EXPECT(contains(err, "Failed to complete multipart upload"),
           "Unexpected error message: ",
           err);
    EXPECT_EQ(size_t, store->count(Operation::UploadPart), 2);
    CHECK(store->objects.empty());
}

void
check_stopped_thread_pool()
{
    s3stream::ThreadPool thread_pool(1, [](const std::string&) {});
    thread_pool.await_stop();

    auto store = std::make_shared<MockObjectStore>();
    const auto err = finish_with_error(make_writer(store, 10), thread_pool);
    EXPECT(contains(err, "thread pool is stopped"),
           "Unexpected error message: ",
           err);
    CHECK(store->requests.empty());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        size_t n_errors = 0;
        s3stream::ThreadPool thread_pool(
          1, [&n_errors](const std::string&) { ++n_errors; });

        check_simple_put_fails(thread_pool);
        check_session_start_fails(thread_pool);
        check_part_upload_fails(thread_pool);
        check_completion_fails(thread_pool);

        // every failed job was reported to the pool's error handler
        thread_pool.await_stop();
        EXPECT_EQ(size_t, n_errors, 4);

        check_stopped_thread_pool();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
