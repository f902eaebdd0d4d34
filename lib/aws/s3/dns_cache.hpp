#pragma once

#include "fastlist/meta.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>

namespace fastlist::aws::s3::_internal {

// Resolved endpoints per host:port, shared by all requests of a session.
// Entries older than the ttl are refreshed by one coroutine while others keep using the stale entry.
class DnsCache {
public:
    using results_type = boost::asio::ip::tcp::resolver::results_type;

private:
    struct Entry {
        std::chrono::steady_clock::time_point created;
        results_type endpoints;
    };

    std::chrono::seconds ttl;
    std::shared_mutex entries_mutex;
    std::map<std::string, std::shared_ptr<const Entry>, std::less<>> entries;
    std::set<std::string, std::less<>> being_updated;

    [[nodiscard]] std::shared_ptr<const Entry> find(const std::string &key);
    // true if the caller should refresh the entry
    [[nodiscard]] bool claim_update(const std::string &key);

public:
    [[nodiscard]] explicit DnsCache(std::chrono::seconds ttl = std::chrono::seconds{60});

    [[nodiscard]] meta::expected_task<results_type, boost::system::error_code> resolve(std::string host,
                                                                                        std::string port);
};

} // namespace fastlist::aws::s3::_internal
