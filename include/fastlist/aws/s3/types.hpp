#pragma once

#include <boost/beast/core/error.hpp>
#include <boost/describe/class.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fastlist::aws::s3 {

struct Object {
    std::optional<std::string> ETag;
    std::optional<std::string> Key;
    // kept in the wire format, e.g. 2009-10-12T17:50:30.000Z
    std::optional<std::string> LastModified;
    std::optional<std::size_t> Size;
    std::optional<std::string> StorageClass;

    [[nodiscard]] Object() = default;
    // Throws std::runtime_error on a malformed Size.
    [[nodiscard]] explicit Object(const pugi::xml_node &xml);
};
BOOST_DESCRIBE_STRUCT(Object, (), (ETag, Key, LastModified, Size, StorageClass));

struct CommonPrefix {
    std::optional<std::string> Prefix;
};
BOOST_DESCRIBE_STRUCT(CommonPrefix, (), (Prefix));

struct ListObjectsV2Result {
    std::optional<std::vector<CommonPrefix>> CommonPrefixes;
    std::optional<std::vector<Object>> Contents;
    std::optional<std::string> ContinuationToken;
    std::optional<std::string> Delimiter;
    bool IsTruncated{};
    std::size_t KeyCount{};
    std::size_t MaxKeys{};
    std::string Name;
    std::optional<std::string> NextContinuationToken;
    std::string Prefix;
    std::optional<std::string> StartAfter;
};
BOOST_DESCRIBE_STRUCT(ListObjectsV2Result, (),
                      (CommonPrefixes, Contents, ContinuationToken, Delimiter, IsTruncated, KeyCount, MaxKeys,
                       Name, NextContinuationToken, Prefix, StartAfter));

// Non-2xx response, decoded from the S3 <Error> body where there is one.
struct HttpError {
    unsigned status{};
    std::string code;
    std::string message;
    std::string request_id;
};
BOOST_DESCRIBE_STRUCT(HttpError, (), (status, code, message, request_id));

using Error = std::variant<boost::beast::error_code, HttpError, pugi::xml_parse_status>;

// Whether retrying the same request may succeed. Throttling, server errors, timeouts and
// connection failures are transient. Authentication, missing buckets, wrong regions and
// unresolvable hosts are not.
[[nodiscard]] bool is_transient(const Error &error);

[[nodiscard]] std::string to_string(const Error &error);

// Throws std::runtime_error if the result is structurally invalid (bad IsTruncated, missing token).
[[nodiscard]] std::expected<ListObjectsV2Result, pugi::xml_parse_status> parse_list_objects_v2(std::string body);

// A body that is empty or not an <Error> document yields an HttpError with only the status set.
[[nodiscard]] HttpError parse_http_error(unsigned status, std::string_view body);

} // namespace fastlist::aws::s3
