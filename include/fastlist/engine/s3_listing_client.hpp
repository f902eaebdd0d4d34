#pragma once

#include "fastlist/aws/credentials.hpp"
#include "fastlist/aws/s3/client.hpp"
#include "fastlist/aws/s3/types.hpp"
#include "fastlist/engine/listing_client.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/meta.hpp"

#include <chrono>
#include <memory>
#include <utility>

namespace fastlist::engine {

class S3ListingClient : public ListingClient {
private:
    aws::s3::Client client_;

public:
    [[nodiscard]] explicit S3ListingClient(aws::s3::Client client) : client_{std::move(client)} {}

    [[nodiscard]] meta::expected_task<ListPage, ListError> list(ListRequest request) override;
};

[[nodiscard]] ListError to_list_error(const aws::s3::Error &error);

// Objects without a key are dropped.
[[nodiscard]] ListPage to_list_page(aws::s3::ListObjectsV2Result result);

// Session for the bucket, region, endpoint and addressing style of context.
// Throws std::invalid_argument for a malformed endpoint.
[[nodiscard]] std::shared_ptr<S3ListingClient> make_s3_listing_client(const TaskContext &context,
                                                                      aws::Credentials credentials,
                                                                      std::chrono::seconds timeout);

} // namespace fastlist::engine
