#include "fastlist/aws/sigv4.hpp"

#include "fastlist/aws/credentials.hpp"
#include "fastlist/meta.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/url/param.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <botan/hash.h>
#include <botan/hex.h>
#include <botan/mac.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <iterator>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fastlist::aws::sigv4 {

namespace {

// sorted by key, values are already percent-encoded
[[nodiscard]] std::string canonical_query(const boost::urls::url_view &target) {
    std::map<std::string, std::string, std::less<>> params;
    for (const auto &param : target.encoded_params()) {
        params.emplace(static_cast<std::string_view>(param.key),
                       param.has_value ? std::string{static_cast<std::string_view>(param.value)} : "");
    }
    std::string ret;
    for (const auto &[key, value] : params) {
        if (!ret.empty()) {
            ret.push_back('&');
        }
        std::format_to(std::back_inserter(ret), "{}={}", key, value);
    }
    return ret;
}

// lowercase name -> trimmed value, for host, content-md5 and x-amz-*
[[nodiscard]] std::map<std::string, std::string, std::less<>>
headers_to_sign(const boost::beast::http::fields &headers) {
    std::map<std::string, std::string, std::less<>> ret;
    for (const auto &header : headers) {
        std::string name{header.name_string()};
        boost::algorithm::to_lower(name);
        if (name != "host" && name != "content-md5" && !name.starts_with("x-amz-")) {
            continue;
        }
        // TODO: join repeated headers with ',' instead of keeping the first one
        ret.emplace(std::move(name), boost::algorithm::trim_copy(std::string{header.value()}));
    }
    return ret;
}

} // namespace

std::string hex_sha256(std::string_view data) {
    auto hash = Botan::HashFunction::create_or_throw("SHA-256");
    hash->update(data);
    return Botan::hex_encode(hash->final(), false);
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    return std::format("{:%Y%m%dT%H%M%SZ}", std::chrono::floor<std::chrono::seconds>(time));
}

namespace _internal {

CanonicalRequest canonicalize(std::string_view method, std::string_view encoded_target,
                              std::span<const std::byte> body, boost::beast::http::fields &headers) {
    const boost::urls::url_view target = boost::urls::parse_origin_form(encoded_target).value();

    const auto signed_header_values = headers_to_sign(headers);
    std::string signed_headers;
    std::string canonical_headers;
    for (const auto &[name, value] : signed_header_values) {
        std::format_to(std::back_inserter(canonical_headers), "{}:{}\n", name, value);
        if (!signed_headers.empty()) {
            signed_headers.push_back(';');
        }
        signed_headers.append(name);
    }

    // the payload hash header is not part of the signed headers unless the caller set it
    std::string payload_hash{headers["x-amz-content-sha256"]};
    if (payload_hash.empty()) {
        payload_hash = hex_sha256(std::string_view{
            meta::safe_reinterpret_cast<const std::string_view::value_type *>(body.data()), body.size()});
        headers.set("x-amz-content-sha256", payload_hash);
    }

    std::string request = std::format("{}\n{}\n{}\n{}\n{}\n{}", method,
                                      static_cast<std::string_view>(target.encoded_path()),
                                      canonical_query(target), canonical_headers, signed_headers, payload_hash);
    return {.request = std::move(request), .signed_headers = std::move(signed_headers)};
}

} // namespace _internal

std::string string_to_sign(std::string_view canonical_request, const Scope &scope,
                           std::string_view timestamp) {
    return std::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", timestamp, scope, hex_sha256(canonical_request));
}

std::vector<std::uint8_t> signing_key(std::string_view secret_access_key, const Scope &scope) {
    auto hmac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-256)");

    std::vector<std::uint8_t> key;
    key.reserve(256);
    std::format_to(std::back_inserter(key), "AWS4{}", secret_access_key);

    // DateKey, DateRegionKey, DateRegionServiceKey, SigningKey
    for (const std::string_view part : {std::string_view{scope.date}, std::string_view{scope.region},
                                        std::string_view{scope.service}, Scope::terminator}) {
        hmac->set_key(key);
        hmac->update(part);
        key = hmac->final_stdvec();
    }
    return key;
}

std::string authorization(const Credentials &credentials, const CanonicalRequest &canonical,
                          std::string_view timestamp, const Scope &scope) {
    auto hmac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-256)");
    hmac->set_key(signing_key(credentials.secret_access_key, scope));
    hmac->update(string_to_sign(canonical.request, scope, timestamp));
    const std::string signature = Botan::hex_encode(hmac->final(), false);

    return std::format("AWS4-HMAC-SHA256 Credential={}/{},SignedHeaders={},Signature={}", credentials.access_key,
                       scope, canonical.signed_headers, signature);
}

} // namespace fastlist::aws::sigv4
