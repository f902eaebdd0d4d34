#pragma once

#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/diff_table.hpp"
#include "fastlist/engine/key_filter.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/run_state.hpp"
#include "fastlist/engine/sinks.hpp"
#include "fastlist/meta.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace fastlist::engine {

enum class AggregationMode : std::uint8_t { List, Diff };

struct AggregatorConfig {
    AggregationMode mode = AggregationMode::List;
    std::shared_ptr<const KeyFilter> filter;
    // how often the channel is drained
    std::chrono::milliseconds poll_interval{10};
};

// Single consumer of the record channel. Writes every record in list mode, or the difference
// between the left and right records in diff mode.
class Aggregator {
private:
    std::shared_ptr<RecordChannel> channel_;
    std::shared_ptr<RunState> state_;
    AggregatorConfig config_;
    std::vector<std::shared_ptr<RecordSink>> sinks_;
    DiffTable diff_;
    bool finalized_ = false;

    void emit(const ObjectRecord &record);
    void emit(const DiffResult &result);

public:
    [[nodiscard]] Aggregator(std::shared_ptr<RecordChannel> channel, std::shared_ptr<RunState> state,
                             AggregatorConfig config, std::vector<std::shared_ptr<RecordSink>> sinks);

    void consume(ObjectRecord record);
    // Emits the unmatched keys of a diff and flushes the sinks. Only the first call has an effect.
    void finalize();

    // Drains the channel until it is closed, then finalizes and marks the task done.
    // The caller keeps the aggregator alive until the coroutine completes.
    [[nodiscard]] meta::task<void> run();

    [[nodiscard]] const DiffTable &diff_table() const noexcept { return diff_; }
};

} // namespace fastlist::engine
