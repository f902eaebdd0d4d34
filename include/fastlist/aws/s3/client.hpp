#pragma once

#include "fastlist/aws/s3/session.hpp"
#include "fastlist/aws/s3/types.hpp"
#include "fastlist/meta.hpp"

#include <boost/describe/class.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace fastlist::aws::s3 {

struct ListObjectsV2Parameters {
    std::string Bucket;
    std::optional<std::string> ContinuationToken;
    std::optional<std::string> Delimiter;
    std::size_t MaxKeys = 1000;
    std::optional<std::string> Prefix;
    std::optional<std::string> StartAfter;

    BOOST_DESCRIBE_STRUCT(ListObjectsV2Parameters, (),
                          (Bucket, ContinuationToken, Delimiter, MaxKeys, Prefix, StartAfter));
};

// Percent-encoded query string for a ListObjectsV2 call, e.g. list-type=2&max-keys=1000&prefix=a%2F
[[nodiscard]] std::string list_objects_v2_query(const ListObjectsV2Parameters &parameters);

class Client {
private:
    std::shared_ptr<Session> session_;

public:
    [[nodiscard]] explicit Client(std::shared_ptr<Session> session) : session_{std::move(session)} {}

    [[nodiscard]] const std::shared_ptr<Session> &session() const { return session_; }

    [[nodiscard]] meta::expected_task<ListObjectsV2Result, Error>
    list_objects_v2(ListObjectsV2Parameters parameters) const;
};

} // namespace fastlist::aws::s3
