#include "../check.hpp"
#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/record.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using fastlist::test::check;
using namespace fastlist::engine;

namespace {

[[nodiscard]] RecordBatch batch_of(std::string_view key) {
    return {ObjectRecord{.key = std::string{key}, .size = 1, .etag = "e"}};
}

[[nodiscard]] std::vector<std::string> drain(RecordChannel &channel) {
    std::vector<std::string> ret;
    RecordBatch batch;
    while (channel.try_pop(batch)) {
        for (auto &record : batch) {
            ret.push_back(std::move(record.key));
        }
    }
    std::ranges::sort(ret);
    return ret;
}

void test_close_on_last_release() {
    const auto channel = std::make_shared<RecordChannel>();
    check(channel->closed(), "no senders yet");

    RecordSender first = channel->make_sender();
    RecordSender second = first;
    check(!channel->closed(), "open while senders exist");

    first.send(batch_of("a"));
    first.finish();
    first.release();
    check(!first.valid(), "released sender is invalid");
    check(!channel->closed(), "the copy still counts");

    RecordSender moved = std::move(second);
    check(!second.valid() && moved.valid(), "move transfers the registration");
    moved.send(batch_of("b"));
    moved.finish();
    moved.release();

    check(channel->closed(), "closed after the last release");
    check(channel->aborted_senders() == 0, "every sender finished");
    check(drain(*channel) == std::vector<std::string>{"a", "b"}, "batches survive the close");
}

void test_abort_is_counted() {
    const auto channel = std::make_shared<RecordChannel>();
    {
        RecordSender finished = channel->make_sender();
        finished.finish();
        RecordSender dropped = channel->make_sender();
        // copying an unfinished sender does not inherit finish()
        RecordSender copy = finished;
    }
    check(channel->closed(), "destructors release");
    check(channel->aborted_senders() == 2, "unfinished senders are counted");

    RecordSender released = channel->make_sender();
    released.release();
    released.release();
    check(channel->aborted_senders() == 3, "release is idempotent");

    bool threw = false;
    try {
        released.send(batch_of("x"));
    } catch (const std::logic_error &) {
        threw = true;
    }
    check(threw, "send after release throws");
}

void test_concurrent_producers() {
    constexpr std::size_t producers = 8;
    constexpr std::size_t batches = 200;

    const auto channel = std::make_shared<RecordChannel>();
    {
        boost::asio::thread_pool pool{4};
        for (std::size_t p = 0; p < producers; p++) {
            boost::asio::post(pool, [sender = channel->make_sender(), p]() mutable {
                for (std::size_t i = 0; i < batches; i++) {
                    sender.send(batch_of(std::format("{}/{:04}", p, i)));
                }
                sender.finish();
            });
        }
        pool.join();
    }
    check(channel->closed(), "closed once every producer is gone");
    check(channel->aborted_senders() == 0, "producers finished");

    const auto keys = drain(*channel);
    check(keys.size() == producers * batches, "nothing lost");
    check(std::ranges::adjacent_find(keys) == keys.end(), "nothing duplicated");
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    test_close_on_last_release();
    test_abort_is_counted();
    test_concurrent_producers();
    return fastlist::test::exit_code();
}
