#include "fastlist/engine/s3_listing_client.hpp"

#include "fastlist/aws/credentials.hpp"
#include "fastlist/aws/s3/client.hpp"
#include "fastlist/aws/s3/session.hpp"
#include "fastlist/aws/s3/types.hpp"
#include "fastlist/engine/listing_client.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/log.hpp"
#include "fastlist/meta.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::engine {

namespace {

[[nodiscard]] std::string strip_quotes(std::string etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

} // namespace

ListError to_list_error(const aws::s3::Error &error) {
    return {.kind = aws::s3::is_transient(error) ? ListError::Kind::Transient : ListError::Kind::Fatal,
            .message = aws::s3::to_string(error)};
}

ListPage to_list_page(aws::s3::ListObjectsV2Result result) {
    ListPage ret;
    if (result.Contents.has_value()) {
        ret.objects.reserve(result.Contents->size());
        for (auto &object : *result.Contents) {
            if (!object.Key.has_value()) {
                log::error("received object without key, ETag {}", object.ETag.value_or("<no ETag>"));
                continue;
            }
            ret.objects.push_back({.key = std::move(*object.Key),
                                   .size = object.Size.value_or(0),
                                   .etag = strip_quotes(object.ETag.value_or("")),
                                   .last_modified = object.LastModified.value_or("")});
        }
    }
    if (result.CommonPrefixes.has_value()) {
        ret.common_prefixes.reserve(result.CommonPrefixes->size());
        for (auto &prefix : *result.CommonPrefixes) {
            if (prefix.Prefix.has_value()) {
                ret.common_prefixes.push_back(std::move(*prefix.Prefix));
            }
        }
    }
    if (result.IsTruncated) {
        ret.next_token = std::move(result.NextContinuationToken);
    }
    return ret;
}

meta::expected_task<ListPage, ListError> S3ListingClient::list(ListRequest request) {
    using rtype = std::expected<ListPage, ListError>;

    auto res = co_await client_.list_objects_v2({.Bucket = std::move(request.bucket),
                                                 .ContinuationToken = std::move(request.continuation_token),
                                                 .Delimiter = std::move(request.delimiter),
                                                 .Prefix = std::move(request.prefix),
                                                 .StartAfter = std::move(request.start_after)});
    if (!res) {
        co_return rtype{std::unexpect, to_list_error(res.error())};
    }
    co_return rtype{to_list_page(std::move(res.value()))};
}

std::shared_ptr<S3ListingClient> make_s3_listing_client(const TaskContext &context,
                                                        aws::Credentials credentials,
                                                        std::chrono::seconds timeout) {
    aws::s3::SessionConfig config =
        aws::s3::make_session_config(context.region, context.endpoint, context.path_style);
    config.timeout = timeout;
    log::debug("bucket {} via {} ({} addressing, region {})", context.bucket,
               std::string_view{config.endpoint.buffer()}, config.path_style ? "path-style" : "virtual-host",
               config.region);
    auto session = std::make_shared<aws::s3::Session>(std::move(credentials), std::move(config));
    return std::make_shared<S3ListingClient>(aws::s3::Client{std::move(session)});
}

} // namespace fastlist::engine
