#pragma once

#include "fastlist/engine/run_state.hpp"
#include "fastlist/meta.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace fastlist::engine {

// Periodic progress report. Decides when the run is over: once every task is done or quit was requested.
class Monitor {
private:
    std::shared_ptr<RunState> state_;
    std::chrono::milliseconds interval_;
    std::function<void()> on_finish_;

public:
    [[nodiscard]] Monitor(std::shared_ptr<RunState> state, std::chrono::milliseconds interval,
                          std::function<void()> on_finish = {});

    // The caller keeps the monitor alive until the coroutine completes.
    [[nodiscard]] meta::task<void> run();

    [[nodiscard]] static std::string format_report(const RunStats &stats, double objects_per_second);
};

} // namespace fastlist::engine
