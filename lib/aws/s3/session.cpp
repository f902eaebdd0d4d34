#include "fastlist/aws/s3/session.hpp"

#include "connection.hpp"
#include "dns_cache.hpp"
#include "fastlist/aws/credentials.hpp"
#include "fastlist/aws/urlencode.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <cstdlib>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace fastlist::aws::s3 {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

[[nodiscard]] std::string region_or_default(std::optional<std::string> region) {
    if (region.has_value() && !region->empty()) {
        return std::move(*region);
    }
    for (const char *name : {"AWS_REGION", "AWS_DEFAULT_REGION"}) {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
            return value;
        }
    }
    return std::string{default_region};
}

} // namespace

SessionConfig make_session_config(std::optional<std::string> region, const std::optional<std::string> &endpoint,
                                  bool force_path_style) {
    SessionConfig ret;
    ret.region = region_or_default(std::move(region));

    if (!endpoint.has_value()) {
        ret.endpoint = boost::urls::url{std::format("https://s3.{}.amazonaws.com", ret.region)};
        ret.path_style = force_path_style;
        return ret;
    }

    auto parsed = boost::urls::parse_absolute_uri(*endpoint);
    if (!parsed) {
        throw std::invalid_argument{std::format("invalid endpoint URL '{}': {}", *endpoint, parsed.error().message())};
    }
    if (parsed->scheme() != "http" && parsed->scheme() != "https") {
        throw std::invalid_argument{std::format("endpoint URL '{}' must use http or https", *endpoint)};
    }
    if (parsed->host().empty()) {
        throw std::invalid_argument{std::format("endpoint URL '{}' has no host", *endpoint)};
    }
    ret.endpoint = boost::urls::url{*parsed};
    ret.path_style = true;
    return ret;
}

Session::Session(Credentials credentials, SessionConfig config)
    : credentials_{std::move(credentials)}, config_{std::move(config)},
      dns_cache_{std::make_shared<_internal::DnsCache>()} {
    ssl_ctx.set_default_verify_paths();
}

_internal::Target Session::target_for(std::string_view bucket) const {
    const boost::urls::url &endpoint = config_.endpoint;
    const bool is_ssl = endpoint.scheme() != "http";

    _internal::Target ret;
    ret.is_ssl = is_ssl;
    ret.port = endpoint.has_port() ? std::string{endpoint.port()} : (is_ssl ? "443" : "80");
    if (config_.path_style) {
        ret.host = endpoint.host();
        ret.host_header = endpoint.encoded_host_and_port();
        ret.path = std::format("/{}", urlencode_path(bucket));
    } else {
        ret.host = std::format("{}.{}", bucket, endpoint.host());
        ret.host_header = std::format("{}.{}", bucket, std::string_view{endpoint.encoded_host_and_port()});
        ret.path = "/";
    }
    return ret;
}

Session::crt Session::get_bucket(std::string_view bucket, std::string query) const {
    using rtype = Session::crt::value_type;

    const _internal::Target target = target_for(bucket);
    const std::string encoded_target = query.empty() ? target.path : std::format("{}?{}", target.path, query);

    boost::beast::http::request<boost::beast::http::string_body> request{boost::beast::http::verb::get,
                                                                         encoded_target, 11};
    _internal::sign_request(request, target.host_header, credentials_, config_.region);

    // TODO: keep connections alive and reuse them across requests of the same worker
    auto connected = co_await _internal::connect(target, ssl_ctx, dns_cache_, config_.timeout);
    if (!connected) {
        co_return rtype{std::unexpect, connected.error()};
    }
    _internal::Stream stream = std::move(connected.value());
    std::visit([&](auto &stream_) { boost::beast::get_lowest_layer(stream_).expires_after(config_.timeout); },
               stream);

    const auto [send_ec, send_n] = co_await std::visit(
        [&request](auto &stream_) { return boost::beast::http::async_write(stream_, request, token); }, stream);
    if (send_ec.failed()) {
        co_return rtype{std::unexpect, send_ec};
    }

    boost::beast::flat_buffer buf;
    response_type response;
    const auto [recv_ec, recv_n] = co_await std::visit(
        [&buf, &response](auto &stream_) {
            // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
            return boost::beast::http::async_read(stream_, buf, response, token);
        },
        stream);
    if (recv_ec.failed()) {
        co_return rtype{std::unexpect, recv_ec};
    }

    co_return response;
}

} // namespace fastlist::aws::s3
