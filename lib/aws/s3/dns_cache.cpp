#include "dns_cache.hpp"

#include "fastlist/meta.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/errc.hpp>             // IWYU pragma: keep
#include <boost/system/error_code.hpp>       // IWYU pragma: keep
#include <boost/system/generic_category.hpp> // IWYU pragma: keep
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace fastlist::aws::s3::_internal {

DnsCache::DnsCache(std::chrono::seconds ttl) : ttl{ttl} {}

std::shared_ptr<const DnsCache::Entry> DnsCache::find(const std::string &key) {
    const std::shared_lock lock{entries_mutex};
    if (const auto iter = entries.find(key); iter != entries.end()) {
        return iter->second;
    }
    return nullptr;
}

bool DnsCache::claim_update(const std::string &key) {
    const std::unique_lock lock{entries_mutex};
    return being_updated.insert(key).second;
}

meta::expected_task<DnsCache::results_type, boost::system::error_code> DnsCache::resolve(std::string host,
                                                                                          std::string port) {
    using rtype = std::expected<results_type, boost::system::error_code>;

    const std::string key = host + ":" + port;
    const auto cached = find(key);
    if (cached != nullptr && cached->created + ttl > std::chrono::steady_clock::now()) {
        co_return cached->endpoints;
    }

    bool updating = false;
    if (cached != nullptr) {
        // Only one coroutine should update a stale entry.
        // Others don't need to wait on a lock though, they can just continue with the old endpoints.
        updating = claim_update(key);
        if (!updating) {
            co_return cached->endpoints;
        }
    }
    const boost::scope::scope_exit release_update{[this, &key, &updating]() {
        if (updating) {
            const std::unique_lock lock{entries_mutex};
            being_updated.erase(key);
        }
    }};

    boost::asio::ip::tcp::resolver resolver{co_await boost::asio::this_coro::executor};
    auto [resolve_ec, resolved] =
        co_await resolver.async_resolve(host, port, boost::asio::as_tuple(boost::asio::use_awaitable));
    if (resolve_ec.failed()) {
        if (cached != nullptr) {
            co_return cached->endpoints;
        }
        co_return rtype{std::unexpect, resolve_ec};
    }
    if (resolved.empty()) {
        co_return rtype{std::unexpect, boost::system::error_code{boost::system::errc::host_unreachable,
                                                                 boost::system::generic_category()}};
    }

    auto entry = std::make_shared<const Entry>(std::chrono::steady_clock::now(), resolved);
    {
        const std::unique_lock lock{entries_mutex};
        entries.insert_or_assign(key, std::move(entry));
    }
    co_return rtype{std::move(resolved)};
}

} // namespace fastlist::aws::s3::_internal
