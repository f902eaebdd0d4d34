#pragma once

#include "dns_cache.hpp"
#include "fastlist/aws/credentials.hpp"
#include "fastlist/meta.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>     // IWYU pragma: keep
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace fastlist::aws::s3::_internal {

using Stream = std::variant<boost::beast::tcp_stream, boost::asio::ssl::stream<boost::beast::tcp_stream>>;

// Where a request for one bucket goes, after applying path-style or virtual-host addressing.
struct Target {
    std::string host;
    std::string port;
    bool is_ssl = true;
    // value of the Host header, includes a non-default port
    std::string host_header;
    // percent-encoded
    std::string path;
};

// Resolves, connects and (for https) performs the TLS handshake with peer verification.
// Every step is bounded by timeout.
[[nodiscard]] meta::expected_task<Stream, boost::beast::error_code>
connect(const Target &target [[clang::lifetimebound]], boost::asio::ssl::context &ssl_ctx,
        std::shared_ptr<DnsCache> dns_cache, std::chrono::seconds timeout);

// Adds host, date, payload hash and security token headers, then the SigV4 Authorization header.
void sign_request(boost::beast::http::request<boost::beast::http::string_body> &request,
                  std::string_view host_header, const Credentials &credentials, std::string_view region);

} // namespace fastlist::aws::s3::_internal
