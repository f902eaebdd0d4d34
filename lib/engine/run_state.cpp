#include "fastlist/engine/run_state.hpp"

#include <cstddef>

namespace fastlist::engine {

bool RunState::request_quit() noexcept {
    bool expected = false;
    return quit.compare_exchange_strong(expected, true);
}

void RunState::task_done() noexcept {
    std::size_t current = tasks_remaining.load();
    // saturate at zero, a double decrement must not make the monitor wait for 2^64 tasks
    while (current != 0 && !tasks_remaining.compare_exchange_weak(current, current - 1)) {
    }
}

RunStats RunState::snapshot() const noexcept {
    return {.objects_listed = objects_listed.load(),
            .objects_matched = objects_matched.load(),
            .records_aggregated = records_aggregated.load(),
            .results_written = results_written.load(),
            .list_ops = list_ops.load(),
            .retries = retries.load(),
            .ranges_incomplete = ranges_incomplete.load(),
            .tasks_remaining = tasks_remaining.load()};
}

} // namespace fastlist::engine
