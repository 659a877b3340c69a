#include "mock.object.store.hh"
#include "s3.writer.hh"
#include "unit.test.macros.hh"

#include <vector>

using Operation = s3stream::test::MockObjectStore::Operation;

namespace {
const s3stream::S3Location location{ .bucket_name = "my-bucket",
                                     .object_key = "path/to/object" };

void
check_small_object(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<s3stream::test::MockObjectStore>();
    auto writer = std::make_unique<s3stream::S3Writer>(
      location,
      store,
      s3stream::PartWriterConfig{ .split_threshold = 32 << 20,
                                  .min_part_size = 5 << 20 });

    std::vector<std::byte> data(100);
    for (auto i = 0u; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i);
    }
    EXPECT_EQ(size_t, writer->write(data), 100);
    writer->flush();
    EXPECT_EQ(size_t, writer->bytes_written(), 100);

    // nothing is sent before finish
    CHECK(store->requests.empty());

    auto future = s3stream::finish(std::move(writer), thread_pool);
    CHECK(writer == nullptr);
    EXPECT_EQ(size_t, future.get(), 100);

    EXPECT_EQ(size_t, store->requests.size(), 1);
    const auto& request = store->requests.front();
    CHECK(request.operation == Operation::PutObject);
    EXPECT_STR_EQ(request.bucket_name, "my-bucket");
    EXPECT_STR_EQ(request.object_name, "path/to/object");
    EXPECT_EQ(size_t, request.nbytes, 100);

    CHECK(store->objects.at("my-bucket/path/to/object") == data);
}

void
check_empty_object(s3stream::ThreadPool& thread_pool)
{
    auto store = std::make_shared<s3stream::test::MockObjectStore>();
    auto writer = std::make_unique<s3stream::S3Writer>(location, store);

    auto future = s3stream::finish(std::move(writer), thread_pool);
    EXPECT_EQ(size_t, future.get(), 0);

    // a zero-length put, never a multipart session
    EXPECT_EQ(size_t, store->requests.size(), 1);
    CHECK(store->requests.front().operation == Operation::PutObject);
    EXPECT_EQ(size_t, store->requests.front().nbytes, 0);
    EXPECT_EQ(size_t, store->count(Operation::CreateMultipart), 0);

    CHECK(store->objects.at("my-bucket/path/to/object").empty());
}

void
check_null_writer(s3stream::ThreadPool& thread_pool)
{
    auto future = s3stream::finish(nullptr, thread_pool);
    EXPECT_THROWS(std::runtime_error, future.get());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        s3stream::ThreadPool thread_pool(1, [](const std::string& err) {
            LOG_ERROR("Upload failed: ", err);
        });

        check_small_object(thread_pool);
        check_empty_object(thread_pool);
        check_null_writer(thread_pool);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
