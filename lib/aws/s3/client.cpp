#include "fastlist/aws/s3/client.hpp"

#include "fastlist/aws/s3/types.hpp"
#include "fastlist/aws/urlencode.hpp"
#include "fastlist/log.hpp"
#include "fastlist/meta.hpp"

#include <boost/beast/http/status.hpp>
#include <expected>
#include <format>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::aws::s3 {

std::string list_objects_v2_query(const ListObjectsV2Parameters &parameters) {
    std::string query;
    auto add_param = [&query](std::string_view name, std::string_view value) {
        if (!query.empty()) {
            query.push_back('&');
        }
        query.append(name);
        query.push_back('=');
        query.append(value);
    };

    add_param("list-type", "2");
    if (parameters.ContinuationToken.has_value()) {
        add_param("continuation-token", urlencode(*parameters.ContinuationToken));
    }
    if (parameters.Delimiter.has_value()) {
        add_param("delimiter", urlencode(*parameters.Delimiter));
    }
    add_param("max-keys", std::format("{}", parameters.MaxKeys));
    if (parameters.Prefix.has_value()) {
        add_param("prefix", urlencode(*parameters.Prefix));
    }
    if (parameters.StartAfter.has_value()) {
        add_param("start-after", urlencode(*parameters.StartAfter));
    }

    return query;
}

meta::expected_task<ListObjectsV2Result, Error> Client::list_objects_v2(ListObjectsV2Parameters parameters) const {
    using rtype = std::expected<ListObjectsV2Result, Error>;

    const std::string query = list_objects_v2_query(parameters);
    auto res = co_await session_->get_bucket(parameters.Bucket, query);
    if (!res) {
        co_return rtype{std::unexpect, res.error()};
    }

    const unsigned status = res->result_int();
    if (boost::beast::http::to_status_class(status) != boost::beast::http::status_class::successful) {
        co_return rtype{std::unexpect, parse_http_error(status, res->body())};
    }

    try {
        auto parsed = parse_list_objects_v2(std::move(res->body()));
        if (!parsed) {
            log::debug("unparseable ListBucketResult for bucket {} query {}", parameters.Bucket, query);
            co_return rtype{std::unexpect, parsed.error()};
        }
        co_return rtype{std::move(parsed.value())};
    } catch (const std::runtime_error &err) {
        log::warn("malformed ListBucketResult for bucket {} query {}: {}", parameters.Bucket, query, err.what());
        co_return rtype{std::unexpect, pugi::xml_parse_status::status_bad_pcdata};
    }
}

} // namespace fastlist::aws::s3
