#pragma once

#include "fastlist/aws/credentials.hpp"
#include "fastlist/meta.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>     // IWYU pragma: keep
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/url/url.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fastlist::aws::s3 {

namespace _internal {

class DnsCache;
struct Target;

} // namespace _internal

struct SessionConfig {
    // scheme, host and optional port. https unless the scheme says http.
    boost::urls::url endpoint;
    std::string region;
    // path-style: https://host/bucket, virtual-host: https://bucket.host/
    bool path_style = false;
    // applies to connect, handshake, write and read of a single request
    std::chrono::seconds timeout{30};
};

// Default region if neither the caller nor AWS_REGION / AWS_DEFAULT_REGION name one.
constexpr std::string_view default_region = "us-east-1";

// Endpoint URL and addressing style for an optional custom endpoint.
// A custom endpoint implies path-style addressing.
// Throws std::invalid_argument if the endpoint is not an absolute http(s) URL.
[[nodiscard]] SessionConfig make_session_config(std::optional<std::string> region,
                                                const std::optional<std::string> &endpoint,
                                                bool force_path_style);

class Session {
public:
    using response_type = boost::beast::http::response<boost::beast::http::string_body>;
    using crt = meta::expected_task<response_type, boost::beast::error_code>;

private:
    Credentials credentials_;
    SessionConfig config_;
    mutable boost::asio::ssl::context ssl_ctx{boost::asio::ssl::context::tls_client};
    std::shared_ptr<_internal::DnsCache> dns_cache_;

    [[nodiscard]] _internal::Target target_for(std::string_view bucket) const;

public:
    [[nodiscard]] Session(Credentials credentials, SessionConfig config);

    [[nodiscard]] const SessionConfig &config() const { return config_; }

    // GET on the root of a bucket. The query must already be percent-encoded.
    [[nodiscard]] crt get_bucket(std::string_view bucket, std::string query) const;
};

} // namespace fastlist::aws::s3
