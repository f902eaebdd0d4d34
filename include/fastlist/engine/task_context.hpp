#pragma once

#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/run_state.hpp"

#include <memory>
#include <optional>
#include <string>

namespace fastlist::engine {

// Everything one listing task needs to know about its side of the run.
struct TaskContext {
    std::string bucket;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;
    bool path_style = false;
    Direction direction = Direction::Left;
    RecordSender sender;
    std::shared_ptr<RunState> state;
};

} // namespace fastlist::engine
