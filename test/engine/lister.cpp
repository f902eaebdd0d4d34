#include "../check.hpp"
#include "fake_listing_client.hpp"
#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/key_filter.hpp"
#include "fastlist/engine/key_space_hints.hpp"
#include "fastlist/engine/lister.hpp"
#include "fastlist/engine/listing_client.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/run_state.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/meta.hpp"

#include <algorithm>
#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using fastlist::test::check;
using fastlist::test::FakeListingClient;
using namespace fastlist::engine;

namespace {

const std::vector<std::string> bucket_keys = {
    "a",       "a/1",     "a/2",          "a/b/1",
    "a/b/2",   "a/b/c/1", "a/c/x/1",      "a/z",
    "b",       "b/1",     "b/2/",         "b/2/3",
    "c/1",     "c/2",     "c/3",          "d/e/f/g",
    "d/e/f/h", "d/ef",    "e",            "e/1",
    "f/\xc3\xa9/1",       "f/\xc3\xa9\xc3\xa9", "g/h/i/j/k/l/m",
    "top-level",          "zz/last",
};

const std::vector<std::vector<std::string>> hint_sets = {
    {},
    {"a/1", "a/2"},
    {"b", "b/2/3", "c"},
    {"a/b", "c", "d/e/f", "e"},
    {"0", "a", "a/b/c", "b/2/", "c/2", "f/\xc3\xa9", "zz"},
};

const std::vector<std::string> prefixes = {"", "a/", "b/2/", "d/e", "f/", "nothing/"};

constexpr RetryPolicy fast_retry{.max_attempts = 3,
                                 .initial_delay = std::chrono::milliseconds{1},
                                 .max_delay = std::chrono::milliseconds{2}};

struct Run {
    std::shared_ptr<Lister> lister;
    std::shared_ptr<RecordChannel> channel;
    std::shared_ptr<RunState> state;
    std::vector<std::string> keys;
};

[[nodiscard]] Run run_lister(std::shared_ptr<ListingClient> client, ListerConfig config,
                             const std::vector<std::string> &hints,
                             std::shared_ptr<RunState> state = std::make_shared<RunState>(1)) {
    Run ret;
    ret.channel = std::make_shared<RecordChannel>();
    ret.state = std::move(state);
    ret.lister = Lister::create({.bucket = "bucket",
                                 .direction = Direction::Right,
                                 .sender = ret.channel->make_sender(),
                                 .state = ret.state},
                                std::move(config), KeySpaceHints{hints}, std::move(client));
    {
        boost::asio::thread_pool pool{4};
        ret.lister->start(pool.get_executor());
        pool.join();
    }

    RecordBatch batch;
    while (ret.channel->try_pop(batch)) {
        for (auto &record : batch) {
            check(record.direction == Direction::Right, "records carry the task direction");
            ret.keys.push_back(std::move(record.key));
        }
    }
    std::ranges::sort(ret.keys);
    return ret;
}

[[nodiscard]] std::vector<std::string> keys_under(std::string_view prefix) {
    std::vector<std::string> ret;
    std::ranges::copy_if(bucket_keys, std::back_inserter(ret),
                         [prefix](const std::string &key) { return key.starts_with(prefix); });
    std::ranges::sort(ret);
    return ret;
}

void test_union_is_complete() {
    for (const auto &hints : hint_sets) {
        for (const auto &prefix : prefixes) {
            for (const std::size_t concurrency : {1UZ, 7UZ}) {
                for (const std::size_t page_size : {1UZ, 3UZ, 1000UZ}) {
                    const std::string what = std::format("hints {} prefix '{}' concurrency {} page size {}",
                                                         hints.size(), prefix, concurrency, page_size);
                    const auto run = run_lister(std::make_shared<FakeListingClient>(bucket_keys, page_size),
                                                {.prefix = prefix,
                                                 .concurrency = concurrency,
                                                 .max_idle_interval = std::chrono::milliseconds{20}},
                                                hints);
                    const auto expected = keys_under(prefix);
                    check(run.keys == expected, "every key exactly once, " + what);
                    check(run.lister->outcome() == ListerOutcome::Complete, "complete, " + what);
                    check(run.state->objects_listed == expected.size(), "objects_listed, " + what);
                    check(run.state->finished(), "task marked done, " + what);
                    check(run.channel->closed() && run.channel->aborted_senders() == 0, "sender finished, " + what);
                }
            }
        }
    }
}

void test_filter() {
    const auto filter = std::make_shared<const KeyFilter>(KeyFilter::compile("prefix:a/"));
    const auto run = run_lister(std::make_shared<FakeListingClient>(bucket_keys),
                                {.concurrency = 5, .filter = filter}, hint_sets.back());
    check(std::ranges::all_of(run.keys, [](const std::string &key) { return key.starts_with("a/"); }),
          "only matching keys are sent");
    check(run.keys == keys_under("a/"), "all matching keys are sent");
    check(run.state->objects_matched == keys_under("a/").size(), "objects_matched counts the filtered total");
    check(run.state->objects_listed == bucket_keys.size(), "objects_listed counts the raw total");
}

void test_transient_errors_are_retried() {
    const auto client = std::make_shared<FakeListingClient>(bucket_keys);
    client->fail_transiently("", 2);
    const auto run = run_lister(client, {.concurrency = 3, .retry = fast_retry}, {});
    check(run.lister->outcome() == ListerOutcome::Complete, "recovered after retries");
    check(run.state->retries == 2, "two retries");
    check(run.keys == keys_under(""), "all keys after retrying");
}

void test_retry_exhaustion_skips_the_range() {
    const auto client = std::make_shared<FakeListingClient>(bucket_keys);
    client->fail_transiently("c/", FakeListingClient::always);
    const auto run = run_lister(client, {.concurrency = 3, .retry = fast_retry}, hint_sets.at(3));

    std::vector<std::string> expected;
    std::ranges::copy_if(keys_under(""), std::back_inserter(expected),
                         [](const std::string &key) { return !key.starts_with("c/"); });
    check(run.lister->outcome() == ListerOutcome::Partial, "partial outcome");
    check(run.lister->ranges_incomplete() == 1 && run.state->ranges_incomplete == 1, "one incomplete range");
    check(run.state->retries == fast_retry.max_attempts - 1, "bounded retries");
    check(run.keys == expected, "other ranges complete");
    check(run.state->finished(), "task marked done");
    check(run.channel->aborted_senders() == 0, "partial runs still finish the sender");
    check(!run.state->fatal, "skipped ranges are not fatal");
}

void test_fatal_error_stops_the_task() {
    const auto client = std::make_shared<FakeListingClient>(bucket_keys, 1);
    client->fail_fatally("d/");
    const auto run = run_lister(client, {.concurrency = 2, .retry = fast_retry}, {});
    check(run.lister->outcome() == ListerOutcome::Failed, "failed outcome");
    check(run.state->fatal, "run marked fatal");
    check(run.state->finished(), "counter decremented on failure");
    check(run.channel->closed() && run.channel->aborted_senders() == 1, "sender dropped without finishing");
    check(std::ranges::none_of(run.keys, [](const std::string &key) { return key.starts_with("d/"); }),
          "nothing from the failing prefix");
}

void test_cancellation() {
    const auto full = std::make_shared<FakeListingClient>(bucket_keys, 1);
    static_cast<void>(run_lister(full, {.concurrency = 2}, {}));

    const auto state = std::make_shared<RunState>(1);
    const auto client = std::make_shared<FakeListingClient>(bucket_keys, 1);
    client->on_call([&state](std::size_t call) {
        if (call == 5) {
            state->request_quit();
        }
    });
    const auto run = run_lister(client, {.concurrency = 2}, {}, state);
    check(run.lister->outcome() == ListerOutcome::Cancelled, "cancelled outcome");
    check(client->calls() <= 5 + 2, "no new pages after quit");
    check(client->calls() < full->calls(), "stopped before the end");
    check(run.state->finished(), "counter decremented on cancellation");
    check(run.channel->aborted_senders() == 1, "cancelled sender is not finished");
    check(!run.state->fatal, "cancellation is not an error");
}

void test_hint_ranges_do_not_relist() {
    constexpr std::size_t keys_per_digit = 20;
    constexpr std::size_t page_size = 10;
    const std::string digits = "0123456789abcdef";

    std::vector<std::string> keys;
    std::vector<std::string> hints;
    for (const char digit : digits) {
        hints.emplace_back(1, digit);
        for (std::size_t i = 0; i < keys_per_digit; i++) {
            keys.push_back(std::format("{}{:06}", digit, i));
        }
    }

    for (const std::size_t concurrency : {1UZ, 8UZ}) {
        const auto client = std::make_shared<FakeListingClient>(keys, page_size);
        const auto run = run_lister(client, {.concurrency = concurrency}, hints);
        check(run.keys.size() == keys.size(), "flat bucket listed completely");
        check(run.lister->outcome() == ListerOutcome::Complete, "flat bucket complete");

        // a serial walk needs keys / page_size pages. Every range may read one extra page
        // to find its end, but never the keys of the ranges before it.
        const std::size_t serial_pages = keys.size() / page_size;
        const std::size_t ranges = KeySpaceHints{hints}.size();
        check(client->calls() <= serial_pages + ranges,
              std::format("{} pages for {} keys in {} ranges", client->calls(), keys.size(), ranges));
    }
}

// answers every request after a delay, with one object and no sub-prefixes
class SlowListingClient : public ListingClient {
private:
    std::chrono::milliseconds delay_;

public:
    [[nodiscard]] explicit SlowListingClient(std::chrono::milliseconds delay) : delay_{delay} {}

    [[nodiscard]] fastlist::meta::expected_task<ListPage, ListError> list(ListRequest request) override {
        boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, delay_};
        co_await timer.async_wait(boost::asio::use_awaitable);
        ListPage ret{.objects = {{.key = request.prefix + "only", .size = 1, .etag = "e"}}};
        co_return std::expected<ListPage, ListError>{std::move(ret)};
    }
};

void test_idle_workers_back_off() {
    constexpr std::size_t concurrency = 16;
    const auto run = run_lister(std::make_shared<SlowListingClient>(std::chrono::milliseconds{300}),
                                {.concurrency = concurrency}, {});
    check(run.lister->outcome() == ListerOutcome::Complete, "single slow range completes");
    check(run.keys == std::vector<std::string>{"only"}, "single slow range listed");
    // polling every 10 ms would take about 30 looks per idle worker
    check(run.lister->idle_wakeups() <= (concurrency - 1) * 10,
          std::format("{} idle wakeups", run.lister->idle_wakeups()));
}

// returns the same continuation token forever
class RepeatingTokenClient : public ListingClient {
public:
    std::atomic<std::size_t> calls{0};

    [[nodiscard]] fastlist::meta::expected_task<ListPage, ListError> list(ListRequest request) override {
        calls++;
        ListPage ret{.objects = {{.key = request.prefix + "x", .size = 1, .etag = "e"}}, .next_token = "same"};
        co_return std::expected<ListPage, ListError>{std::move(ret)};
    }
};

void test_repeated_token() {
    const auto client = std::make_shared<RepeatingTokenClient>();
    const auto run = run_lister(client, {.concurrency = 4}, {});
    check(run.lister->outcome() == ListerOutcome::Partial, "repeated token leaves the range incomplete");
    check(client->calls == 2, "pagination stops at the repeated token");
    check(run.state->ranges_incomplete == 1, "counted as incomplete");
}

void test_config_validation() {
    bool threw = false;
    try {
        static_cast<void>(Lister::create({.state = std::make_shared<RunState>(1)}, {.concurrency = 0},
                                         KeySpaceHints{}, std::make_shared<FakeListingClient>(bucket_keys)));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    check(threw, "zero concurrency is rejected");

    constexpr RetryPolicy policy{.initial_delay = std::chrono::milliseconds{200},
                                 .max_delay = std::chrono::milliseconds{1000}};
    check(policy.delay(1) == std::chrono::milliseconds{200}, "first backoff");
    check(policy.delay(2) == std::chrono::milliseconds{400}, "doubling backoff");
    check(policy.delay(3) == std::chrono::milliseconds{800}, "doubling backoff again");
    check(policy.delay(4) == std::chrono::milliseconds{1000}, "capped backoff");
    check(policy.delay(40) == std::chrono::milliseconds{1000}, "capped without overflow");
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    test_union_is_complete();
    test_filter();
    test_transient_errors_are_retried();
    test_retry_exhaustion_skips_the_range();
    test_fatal_error_stops_the_task();
    test_cancellation();
    test_repeated_token();
    test_hint_ranges_do_not_relist();
    test_idle_workers_back_off();
    test_config_validation();
    return fastlist::test::exit_code();
}
