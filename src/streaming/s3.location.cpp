#include "macros.hh"
#include "s3.location.hh"

#include <algorithm>
#include <cctype>

namespace {
constexpr std::string_view expected_scheme = "s3";

[[nodiscard]]
std::string
invalid_location(std::string_view uri, std::string_view reason)
{
    return LOG_ERROR("Invalid S3 URI '", uri, "': ", reason);
}

// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool
is_valid_scheme(std::string_view scheme)
{
    if (scheme.empty() ||
        !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }

    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
               c == '-' || c == '.';
    });
}

std::string
to_lower(std::string_view s)
{
    std::string lowered(s);
    std::transform(
      lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
          return static_cast<char>(std::tolower(c));
      });
    return lowered;
}
} // namespace

s3stream::S3Location
s3stream::S3Location::parse(std::string_view uri)
{
    const auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos) {
        throw std::invalid_argument(invalid_location(uri, "missing scheme"));
    }

    const auto scheme = uri.substr(0, scheme_end);
    if (!is_valid_scheme(scheme)) {
        throw std::invalid_argument(
          invalid_location(uri, "malformed scheme"));
    }

    if (to_lower(scheme) != expected_scheme) {
        throw std::invalid_argument(LOG_ERROR(
          "Expected ", expected_scheme, ":// URI, got: ", to_lower(scheme)));
    }

    auto rest = uri.substr(scheme_end + 3);

    // query and fragment are not part of the object key
    if (const auto pos = rest.find_first_of("?#");
        pos != std::string_view::npos) {
        rest = rest.substr(0, pos);
    }

    const auto authority_end = rest.find('/');
    const auto authority = rest.substr(0, authority_end);
    if (authority.empty()) {
        throw std::invalid_argument(LOG_ERROR("S3 URI missing bucket name"));
    }

    if (authority.find_first_of("@:") != std::string_view::npos) {
        throw std::invalid_argument(
          invalid_location(uri, "bucket must not contain userinfo or port"));
    }

    if (authority.length() < 3 || authority.length() > 63) {
        throw std::invalid_argument(LOG_ERROR("Invalid length for S3 bucket name: ",
                                              authority.length(),
                                              ". Must be between 3 "
                                              "and 63 characters"));
    }

    std::string_view path;
    if (authority_end != std::string_view::npos) {
        path = rest.substr(authority_end);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }

    if (path.empty()) {
        throw std::invalid_argument(invalid_location(uri, "missing object key"));
    }

    return S3Location{ .bucket_name = std::string(authority),
                       .object_key = std::string(path) };
}

std::string
s3stream::S3Location::to_uri() const
{
    return std::string(expected_scheme) + "://" + bucket_name + "/" +
           object_key;
}
