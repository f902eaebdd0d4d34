#include "fastlist/engine/monitor.hpp"

#include "fastlist/engine/run_state.hpp"
#include "fastlist/log.hpp"
#include "fastlist/meta.hpp"

#include <algorithm>
#include <boost/accumulators/framework/accumulator_set.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/rolling_window.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace fastlist::engine {

namespace {

// upper bound on how long the end of the run goes unnoticed
constexpr std::chrono::milliseconds check_interval{100};

[[nodiscard]] bool run_over(const RunState &state) { return state.finished() || state.quit_requested(); }

} // namespace

Monitor::Monitor(std::shared_ptr<RunState> state, std::chrono::milliseconds interval,
                 std::function<void()> on_finish)
    : state_{std::move(state)}, interval_{interval}, on_finish_{std::move(on_finish)} {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument{"monitor interval must be positive"};
    }
}

std::string Monitor::format_report(const RunStats &stats, double objects_per_second) {
    return std::format("{} objects listed, {} matched, {} aggregated, {} results written, {} list ops, "
                       "{} retries, {} incomplete ranges, {} tasks running, {:.2f} objects/s",
                       stats.objects_listed, stats.objects_matched, stats.records_aggregated,
                       stats.results_written, stats.list_ops, stats.retries, stats.ranges_incomplete,
                       stats.tasks_remaining, objects_per_second);
}

meta::task<void> Monitor::run() {
    // the driver stops listening for signals here, so this has to run on every way out
    const boost::scope::scope_exit notify{[this]() {
        if (on_finish_) {
            on_finish_();
        }
    }};

    using namespace boost::accumulators;
    accumulator_set<double, stats<tag::rolling_mean>> objects_accumulator{tag::rolling_window::window_size = 60};

    const auto executor = co_await boost::asio::this_coro::executor;
    std::size_t previous_objects = state_->objects_listed.load();
    auto previous_tick = std::chrono::steady_clock::now();

    bool done = false;
    while (!done) {
        const auto next_report = previous_tick + interval_;
        while (!(done = run_over(*state_))) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= next_report) {
                break;
            }
            boost::asio::steady_timer timer{
                executor, std::min<std::chrono::steady_clock::duration>(next_report - now, check_interval)};
            const auto [wait_ec] = co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
            if (wait_ec.failed() && wait_ec != boost::asio::error::operation_aborted) {
                throw boost::system::system_error{wait_ec};
            }
        }

        const auto now = std::chrono::steady_clock::now();
        const std::chrono::duration<double> elapsed = now - previous_tick;
        previous_tick = now;

        const RunStats current = state_->snapshot();
        if (elapsed.count() > 0) {
            objects_accumulator(static_cast<double>(current.objects_listed - previous_objects) / elapsed.count());
        }
        previous_objects = current.objects_listed;

        log::info("{}", format_report(current, rolling_mean(objects_accumulator)));
    }

    if (state_->quit_requested() && !state_->finished()) {
        log::warn("quit requested, waiting for {} tasks to wind down", state_->tasks_remaining.load());
    }
}

} // namespace fastlist::engine
