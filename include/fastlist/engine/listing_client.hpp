#pragma once

#include "fastlist/meta.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fastlist::engine {

struct ListRequest {
    std::string bucket;
    std::string prefix;
    std::optional<std::string> delimiter;
    // list keys strictly after this one
    std::optional<std::string> start_after;
    std::optional<std::string> continuation_token;
};

struct ListedObject {
    std::string key;
    std::uint64_t size{};
    // without the surrounding quotes
    std::string etag;
    std::string last_modified;
};

struct ListPage {
    std::vector<ListedObject> objects;
    std::vector<std::string> common_prefixes;
    // absent on the last page
    std::optional<std::string> next_token;
};

struct ListError {
    enum class Kind : std::uint8_t {
        // throttling, timeouts, dropped connections. The same request may succeed later.
        Transient,
        // bad credentials, missing bucket, wrong region, unresolvable endpoint
        Fatal,
    };
    Kind kind = Kind::Transient;
    std::string message;
};

// "List keys under a prefix, optionally delimited, paginated."
class ListingClient {
public:
    virtual ~ListingClient() = default;

    [[nodiscard]] virtual meta::expected_task<ListPage, ListError> list(ListRequest request) = 0;
};

} // namespace fastlist::engine
