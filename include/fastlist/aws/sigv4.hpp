#pragma once

#include "fastlist/aws/credentials.hpp"
#include "fastlist/meta.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// see https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html

namespace fastlist::aws::sigv4 {

struct Scope {
    std::string date; // YYYYMMDD
    std::string region;
    std::string service;
    constexpr static std::string_view terminator = "aws4_request";
};

struct CanonicalRequest {
    std::string request;
    std::string signed_headers;
};

// lowercase hex, as used for x-amz-content-sha256
[[nodiscard]] std::string hex_sha256(std::string_view data);

// ISO8601 basic format, e.g. 20240831T234309Z
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point time);

namespace _internal {

[[nodiscard]] CanonicalRequest canonicalize(std::string_view method, std::string_view encoded_target,
                                            std::span<const std::byte> body,
                                            boost::beast::http::fields &headers);

} // namespace _internal

// Sets x-amz-content-sha256 from the body when the header is missing.
template <typename Request> [[nodiscard]] CanonicalRequest canonicalize(Request &request) {
    return _internal::canonicalize(
        request.method_string(), request.target(),
        std::span<const std::byte>{meta::safe_reinterpret_cast<const std::byte *>(request.body().data()),
                                   request.body().size()},
        request.base());
}

[[nodiscard]] std::string string_to_sign(std::string_view canonical_request, const Scope &scope,
                                         std::string_view timestamp);

[[nodiscard]] std::vector<std::uint8_t> signing_key(std::string_view secret_access_key, const Scope &scope);

// Value of the Authorization header.
[[nodiscard]] std::string authorization(const Credentials &credentials, const CanonicalRequest &canonical,
                                        std::string_view timestamp, const Scope &scope);

} // namespace fastlist::aws::sigv4

template <> struct std::formatter<fastlist::aws::sigv4::Scope> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const fastlist::aws::sigv4::Scope &scope, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}/{}/{}/{}", scope.date, scope.region, scope.service,
                              fastlist::aws::sigv4::Scope::terminator);
    }
};
