#pragma once

#include <atomic>
#include <cstddef>

namespace fastlist::engine {

// Plain copy of the RunState counters. The individual loads are not taken atomically as a group.
struct RunStats {
    std::size_t objects_listed{};
    std::size_t objects_matched{};
    std::size_t records_aggregated{};
    std::size_t results_written{};
    std::size_t list_ops{};
    std::size_t retries{};
    std::size_t ranges_incomplete{};
    std::size_t tasks_remaining{};
};

// State shared by every task of one run.
class RunState {
public:
    std::atomic<bool> quit{false};
    std::atomic<bool> fatal{false};
    // listers + aggregator. Each decrements exactly once on its way out.
    std::atomic<std::size_t> tasks_remaining;

    // in-range objects returned by the provider
    std::atomic<std::size_t> objects_listed{0};
    // objects that passed the filter and were sent to the aggregator
    std::atomic<std::size_t> objects_matched{0};
    std::atomic<std::size_t> records_aggregated{0};
    // lines handed to the output sinks
    std::atomic<std::size_t> results_written{0};
    std::atomic<std::size_t> list_ops{0};
    std::atomic<std::size_t> retries{0};
    std::atomic<std::size_t> ranges_incomplete{0};

    [[nodiscard]] explicit RunState(std::size_t tasks) : tasks_remaining{tasks} {}

    RunState(const RunState &) = delete;
    RunState &operator=(const RunState &) = delete;

    // Returns true for the call that actually set the flag.
    bool request_quit() noexcept;
    [[nodiscard]] bool quit_requested() const noexcept { return quit.load(); }

    // Marks the run as failed. Does not stop other tasks.
    void report_fatal() noexcept { fatal = true; }

    void task_done() noexcept;
    [[nodiscard]] bool finished() const noexcept { return tasks_remaining.load() == 0; }

    [[nodiscard]] RunStats snapshot() const noexcept;
};

} // namespace fastlist::engine
