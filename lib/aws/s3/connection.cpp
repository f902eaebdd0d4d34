#include "connection.hpp"

#include "dns_cache.hpp"
#include "fastlist/aws/credentials.hpp"
#include "fastlist/aws/sigv4.hpp"
#include "fastlist/meta.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <chrono>
#include <expected>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace fastlist::aws::s3::_internal {

namespace {
constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);
}

meta::expected_task<Stream, boost::beast::error_code> connect(const Target &target,
                                                              boost::asio::ssl::context &ssl_ctx,
                                                              std::shared_ptr<DnsCache> dns_cache,
                                                              std::chrono::seconds timeout) {
    using rtype = std::expected<Stream, boost::beast::error_code>;

    const auto executor = co_await boost::asio::this_coro::executor;
    Stream stream = target.is_ssl ? Stream{std::in_place_index<1>, executor, ssl_ctx}
                                  : Stream{std::in_place_index<0>, executor};

    const auto resolved = co_await dns_cache->resolve(target.host, target.port);
    if (!resolved) {
        co_return rtype{std::unexpect, resolved.error()};
    }

    std::visit([&](auto &stream_) { boost::beast::get_lowest_layer(stream_).expires_after(timeout); }, stream);

    {
        const auto [con_ec, con_ep] = co_await std::visit(
            [&](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::get_lowest_layer(stream_).async_connect(resolved.value(), token);
            },
            stream);
        if (con_ec.failed()) {
            co_return rtype{std::unexpect, con_ec};
        }
    }

    if (target.is_ssl) {
        auto &ssl_stream = std::get<1>(stream);
        if (SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str()) != 1) {
            co_return rtype{std::unexpect,
                            boost::beast::error_code{static_cast<int>(::ERR_get_error()),
                                                     boost::asio::error::get_ssl_category()}};
        }
        ssl_stream.set_verify_mode(boost::asio::ssl::verify_peer);
        ssl_stream.set_verify_callback(boost::asio::ssl::host_name_verification{target.host});

        const auto [shake_ec] = co_await ssl_stream.async_handshake(boost::asio::ssl::stream_base::client, token);
        if (shake_ec.failed()) {
            co_return rtype{std::unexpect, shake_ec};
        }
    }

    co_return rtype{std::move(stream)};
}

void sign_request(boost::beast::http::request<boost::beast::http::string_body> &request,
                  std::string_view host_header, const Credentials &credentials, std::string_view region) {
    request.set(boost::beast::http::field::host, host_header);
    request.set(boost::beast::http::field::user_agent, "fastlist");
    request.set(boost::beast::http::field::accept_encoding, "identity");
    if (credentials.session_token.has_value()) {
        request.set("x-amz-security-token", *credentials.session_token);
    }

    const std::string timestamp = sigv4::format_timestamp(std::chrono::system_clock::now());
    request.set("x-amz-date", timestamp);
    request.set("x-amz-content-sha256", sigv4::hex_sha256(request.body()));
    request.prepare_payload();

    const sigv4::Scope scope{.date = timestamp.substr(0, 8), .region = std::string{region}, .service = "s3"};
    const sigv4::CanonicalRequest canonical = sigv4::canonicalize(request);
    request.set(boost::beast::http::field::authorization,
                sigv4::authorization(credentials, canonical, timestamp, scope));
}

} // namespace fastlist::aws::s3::_internal
