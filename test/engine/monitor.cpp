#include "../check.hpp"
#include "fastlist/engine/monitor.hpp"
#include "fastlist/engine/run_state.hpp"

#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

using fastlist::test::check;
using namespace fastlist::engine;

namespace {

// Runs the monitor to completion and returns how often on_finish was called.
[[nodiscard]] int run_monitor(const std::shared_ptr<RunState> &state, std::chrono::milliseconds interval,
                              std::chrono::milliseconds finish_after = std::chrono::milliseconds::zero()) {
    int finished = 0;
    Monitor monitor{state, interval, [&finished]() { finished++; }};

    boost::asio::io_context ctx;
    boost::asio::steady_timer timer{ctx, finish_after};
    if (finish_after > std::chrono::milliseconds::zero()) {
        timer.async_wait([&state](const boost::system::error_code &) {
            state->objects_listed += 1000;
            state->task_done();
        });
    }
    boost::asio::co_spawn(ctx, monitor.run(), [](const std::exception_ptr &error) {
        if (error) {
            std::rethrow_exception(error);
        }
    });
    ctx.run();
    return finished;
}

void test_run_state() {
    RunState state{2};
    check(state.request_quit(), "first quit request sets the flag");
    check(!state.request_quit(), "second quit request does not");
    check(state.quit_requested(), "quit visible");

    state.task_done();
    state.task_done();
    state.task_done();
    check(state.finished() && state.tasks_remaining == 0, "task counter saturates at zero");

    state.objects_listed = 5;
    state.report_fatal();
    const RunStats stats = state.snapshot();
    check(stats.objects_listed == 5 && stats.tasks_remaining == 0, "snapshot");
    check(state.fatal, "fatal recorded");
}

void test_monitor_finishes() {
    check(run_monitor(std::make_shared<RunState>(0), std::chrono::milliseconds{1000}) == 1,
          "nothing to wait for");

    const auto quitting = std::make_shared<RunState>(3);
    quitting->request_quit();
    check(run_monitor(quitting, std::chrono::milliseconds{1000}) == 1, "quit ends the wait");

    const auto state = std::make_shared<RunState>(1);
    const auto started = std::chrono::steady_clock::now();
    check(run_monitor(state, std::chrono::milliseconds{20}, std::chrono::milliseconds{120}) == 1,
          "last task ends the wait");
    check(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds{120}, "waited for the task");

    bool threw = false;
    try {
        Monitor invalid{state, std::chrono::milliseconds::zero()};
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    check(threw, "zero interval rejected");
}

void test_report() {
    const std::string report = Monitor::format_report(
        {.objects_listed = 1200, .objects_matched = 1000, .list_ops = 3, .tasks_remaining = 2}, 1234.5);
    check(report.contains("1200 objects listed"), "listed count");
    check(report.contains("1000 matched"), "matched count");
    check(report.contains("3 list ops"), "list ops");
    check(report.contains("2 tasks running"), "running tasks");
    check(report.contains("1234.50 objects/s"), "rate");
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    test_run_state();
    test_monitor_finishes();
    test_report();
    return fastlist::test::exit_code();
}
