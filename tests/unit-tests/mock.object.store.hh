#pragma once

#include "object.store.hh"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace s3stream::test {
/// @brief An in-memory object store that records every request it receives.
class MockObjectStore : public ObjectStore
{
  public:
    enum class Operation
    {
        PutObject,
        CreateMultipart,
        UploadPart,
        CompleteMultipart,
    };

    struct Request
    {
        Operation operation;
        std::string bucket_name;
        std::string object_name;
        size_t nbytes;
        unsigned int part_number;
    };

    std::vector<Request> requests;
    std::map<std::string, std::vector<std::byte>> objects;

    /// Fail requests of this kind. For UploadPart, only the part
    /// numbered fail_part_number fails.
    std::optional<Operation> fail_operation;
    unsigned int fail_part_number{ 0 };

    std::string put_object(std::string_view bucket_name,
                           std::string_view object_name,
                           std::span<std::byte> data) override
    {
        record_(Operation::PutObject, bucket_name, object_name, data.size(), 0);
        if (should_fail_(Operation::PutObject, 0)) {
            return {};
        }

        objects[key_(bucket_name, object_name)].assign(data.begin(),
                                                       data.end());
        return "etag-object";
    }

    std::string create_multipart_object(std::string_view bucket_name,
                                        std::string_view object_name) override
    {
        record_(Operation::CreateMultipart, bucket_name, object_name, 0, 0);
        if (should_fail_(Operation::CreateMultipart, 0)) {
            return {};
        }

        const auto upload_id = "upload-" + std::to_string(++n_uploads_);
        pending_[upload_id] = {};
        return upload_id;
    }

    std::string upload_multipart_object_part(std::string_view bucket_name,
                                             std::string_view object_name,
                                             std::string_view upload_id,
                                             std::span<std::byte> data,
                                             unsigned int part_number) override
    {
        record_(Operation::UploadPart,
                bucket_name,
                object_name,
                data.size(),
                part_number);
        if (should_fail_(Operation::UploadPart, part_number)) {
            return {};
        }

        auto it = pending_.find(std::string(upload_id));
        if (it == pending_.end()) {
            return {};
        }

        const auto etag = "etag-part-" + std::to_string(part_number);
        it->second[etag].assign(data.begin(), data.end());
        return etag;
    }

    bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::vector<UploadedPart>& parts) override
    {
        record_(
          Operation::CompleteMultipart, bucket_name, object_name, 0, 0);
        if (should_fail_(Operation::CompleteMultipart, 0)) {
            return false;
        }

        auto it = pending_.find(std::string(upload_id));
        if (it == pending_.end()) {
            return false;
        }

        std::vector<std::byte> object;
        for (const auto& part : parts) {
            const auto& data = it->second.at(part.etag);
            if (data.size() != part.size) {
                return false;
            }
            object.insert(object.end(), data.begin(), data.end());
        }

        objects[key_(bucket_name, object_name)] = std::move(object);
        pending_.erase(it);
        return true;
    }

    size_t count(Operation operation) const
    {
        size_t n = 0;
        for (const auto& request : requests) {
            n += request.operation == operation;
        }
        return n;
    }

    /// Multipart sessions that were started but never completed.
    size_t pending_uploads() const { return pending_.size(); }

  private:
    // upload id -> etag -> data
    std::map<std::string, std::map<std::string, std::vector<std::byte>>>
      pending_;
    size_t n_uploads_{ 0 };

    static std::string key_(std::string_view bucket, std::string_view object)
    {
        return std::string(bucket) + "/" + std::string(object);
    }

    void record_(Operation operation,
                 std::string_view bucket_name,
                 std::string_view object_name,
                 size_t nbytes,
                 unsigned int part_number)
    {
        requests.push_back({ .operation = operation,
                             .bucket_name = std::string(bucket_name),
                             .object_name = std::string(object_name),
                             .nbytes = nbytes,
                             .part_number = part_number });
    }

    bool should_fail_(Operation operation, unsigned int part_number) const
    {
        if (!fail_operation || *fail_operation != operation) {
            return false;
        }

        return operation != Operation::UploadPart ||
               part_number == fail_part_number;
    }
};
} // namespace s3stream::test
