#pragma once

#include "fastlist/engine/key_filter.hpp"
#include "fastlist/engine/key_space_hints.hpp"
#include "fastlist/engine/listing_client.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/meta.hpp"

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

namespace fastlist::engine {

struct RetryPolicy {
    // including the first attempt
    unsigned max_attempts = 5;
    std::chrono::milliseconds initial_delay{200};
    std::chrono::milliseconds max_delay{10'000};

    // Wait after the given failed attempt (1-based), doubling from initial_delay up to max_delay.
    [[nodiscard]] std::chrono::milliseconds delay(unsigned attempt) const;
};

struct ListerConfig {
    // starting prefix, empty for the whole bucket
    std::string prefix;
    std::size_t concurrency = 100;
    std::shared_ptr<const KeyFilter> filter;
    RetryPolicy retry;
    // how often retry waits look at the quit flag, and the first wait of a worker that found no work
    std::chrono::milliseconds poll_interval{10};
    // idle workers back off up to this interval between looks at the queue
    std::chrono::milliseconds max_idle_interval{250};
};

enum class ListerOutcome : std::uint8_t {
    Running,
    // every range listed
    Complete,
    // finished, but some ranges were skipped after exhausting retries
    Partial,
    Cancelled,
    Failed,
};

[[nodiscard]] std::string_view to_string(ListerOutcome outcome) noexcept;

// Lists one bucket with a fixed number of worker coroutines sharing a queue of key ranges.
// Common prefixes found while listing become new queue entries, so hot parts of the key space
// are split up as they are discovered.
class Lister : public std::enable_shared_from_this<Lister> {
private:
    struct WorkItem {
        std::string prefix;
        KeyRange range;
        std::size_t depth = 0;

        [[nodiscard]] std::weak_ordering operator<=>(const WorkItem &rhs) const noexcept {
            return depth <=> rhs.depth;
        }
        [[nodiscard]] bool operator==(const WorkItem &rhs) const noexcept { return depth == rhs.depth; }
    };
    // shallowest first
    using WorkQueue = std::priority_queue<WorkItem, std::vector<WorkItem>, std::greater<>>;

    TaskContext context_;
    ListerConfig config_;
    std::shared_ptr<ListingClient> client_;

    std::mutex queue_mutex_;
    WorkQueue queue_;
    // queued + in flight
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> active_workers_{0};
    std::atomic<std::size_t> ranges_incomplete_{0};
    std::atomic<std::size_t> idle_wakeups_{0};
    std::atomic<bool> failed_{false};
    // a range was left unfinished because of quit or failure
    std::atomic<bool> abandoned_{false};
    std::atomic<bool> started_{false};
    std::atomic<ListerOutcome> outcome_{ListerOutcome::Running};

    struct PrivateTag {};

    void push(WorkItem item);
    [[nodiscard]] std::optional<WorkItem> pop();

    [[nodiscard]] bool should_stop() const noexcept;

    [[nodiscard]] meta::task<void> worker(std::shared_ptr<Lister> self);
    [[nodiscard]] meta::task<void> process(WorkItem item);
    // nullopt if the range cannot be listed any further
    [[nodiscard]] meta::task<std::optional<ListPage>> list_with_retry(const ListRequest &request);
    // false if the task has to stop
    [[nodiscard]] meta::task<bool> sleep(std::chrono::milliseconds duration);

    void worker_exited(const std::exception_ptr &error);
    void finish();

public:
    [[nodiscard]] Lister(PrivateTag tag, TaskContext context, ListerConfig config, const KeySpaceHints &hints,
                         std::shared_ptr<ListingClient> client);

    // Seeds the queue with every hint range that intersects the starting prefix.
    [[nodiscard]] static std::shared_ptr<Lister> create(TaskContext context, ListerConfig config,
                                                        const KeySpaceHints &hints,
                                                        std::shared_ptr<ListingClient> client);

    // Spawns the workers. When the last one exits the sender is released and the task is marked done.
    void start(const boost::asio::any_io_executor &executor);

    [[nodiscard]] ListerOutcome outcome() const noexcept { return outcome_.load(); }
    [[nodiscard]] std::size_t ranges_incomplete() const noexcept { return ranges_incomplete_.load(); }
    // times a worker waited for the queue to fill up
    [[nodiscard]] std::size_t idle_wakeups() const noexcept { return idle_wakeups_.load(); }
    [[nodiscard]] Direction direction() const noexcept { return context_.direction; }
    [[nodiscard]] const std::string &bucket() const noexcept { return context_.bucket; }
};

} // namespace fastlist::engine
