#include "../check.hpp"
#include "fastlist/aws/s3/session.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

using fastlist::test::check;

namespace {

[[nodiscard]] bool throws_invalid_argument(const char *endpoint) {
    try {
        static_cast<void>(fastlist::aws::s3::make_session_config("us-east-1", endpoint, false));
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    // NOLINTBEGIN(concurrency-mt-unsafe)
    ::unsetenv("AWS_REGION");
    ::unsetenv("AWS_DEFAULT_REGION");
    // NOLINTEND(concurrency-mt-unsafe)

    const auto aws = fastlist::aws::s3::make_session_config("eu-west-1", std::nullopt, false);
    check(std::string_view{aws.endpoint.buffer()} == "https://s3.eu-west-1.amazonaws.com", "regional endpoint");
    check(aws.region == "eu-west-1", "explicit region");
    check(!aws.path_style, "virtual-host addressing on AWS");

    const auto forced = fastlist::aws::s3::make_session_config("eu-west-1", std::nullopt, true);
    check(forced.path_style, "forced path-style addressing");

    const auto fallback = fastlist::aws::s3::make_session_config(std::nullopt, std::nullopt, false);
    check(fallback.region == fastlist::aws::s3::default_region, "default region");

    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    ::setenv("AWS_DEFAULT_REGION", "ap-south-1", 1);
    const auto from_env = fastlist::aws::s3::make_session_config(std::nullopt, std::nullopt, false);
    check(from_env.region == "ap-south-1", "region from AWS_DEFAULT_REGION");

    const auto custom =
        fastlist::aws::s3::make_session_config("default", "http://rgw.example.org:7480", false);
    check(custom.path_style, "custom endpoint implies path-style addressing");
    check(custom.endpoint.host() == "rgw.example.org", "custom host");
    check(custom.endpoint.port() == "7480", "custom port");

    check(throws_invalid_argument("ftp://example.org"), "non-http scheme");
    check(throws_invalid_argument("not a url"), "garbage endpoint");
    check(throws_invalid_argument("https://"), "endpoint without host");

    return fastlist::test::exit_code();
}
