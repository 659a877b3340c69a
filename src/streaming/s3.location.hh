#pragma once

#include <string>
#include <string_view>

namespace s3stream {
/// @brief The bucket and key of a single object in the store.
struct S3Location
{
    std::string bucket_name;
    std::string object_key;

    /**
     * @brief Parse a location of the form s3://bucket/path/to/object.
     * @details Leading slashes are stripped from the key, and any query or
     * fragment is dropped.
     * @param uri The location to parse.
     * @return The parsed location.
     * @throw std::invalid_argument if @p uri is not a parseable URI, if its
     * scheme is not "s3", if it has no bucket, or if the bucket or key is
     * invalid.
     */
    static S3Location parse(std::string_view uri);

    /// @brief Format the location as an s3:// URI.
    std::string to_uri() const;
};
} // namespace s3stream
