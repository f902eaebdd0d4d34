#include "fastlist/engine/aggregator.hpp"

#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/run_state.hpp"
#include "fastlist/engine/sinks.hpp"
#include "fastlist/log.hpp"
#include "fastlist/meta.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace fastlist::engine {

Aggregator::Aggregator(std::shared_ptr<RecordChannel> channel, std::shared_ptr<RunState> state,
                       AggregatorConfig config, std::vector<std::shared_ptr<RecordSink>> sinks)
    : channel_{std::move(channel)}, state_{std::move(state)}, config_{std::move(config)},
      sinks_{std::move(sinks)} {}

void Aggregator::emit(const ObjectRecord &record) {
    for (const auto &sink : sinks_) {
        sink->write(record);
    }
    state_->results_written++;
}

void Aggregator::emit(const DiffResult &result) {
    for (const auto &sink : sinks_) {
        sink->write(result);
    }
    state_->results_written++;
}

void Aggregator::consume(ObjectRecord record) {
    state_->records_aggregated++;
    if (config_.filter && !config_.filter->matches(record.key)) {
        return;
    }
    if (config_.mode == AggregationMode::List) {
        emit(record);
        return;
    }
    if (auto result = diff_.add(std::move(record)); result.has_value()) {
        emit(*result);
    }
}

void Aggregator::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;

    if (config_.mode == AggregationMode::Diff) {
        log::info("{} keys present on both sides, {} on one side only", diff_.matched(), diff_.pending());
        for (const auto &result : diff_.drain_unmatched()) {
            emit(result);
        }
    }
    for (const auto &sink : sinks_) {
        sink->flush();
    }
}

meta::task<void> Aggregator::run() {
    const boost::scope::scope_exit mark_done{[this]() { state_->task_done(); }};
    const auto executor = co_await boost::asio::this_coro::executor;

    RecordBatch batch;
    while (true) {
        // senders push before they release, so a drain after seeing closed() gets everything
        const bool closed = channel_->closed();
        while (channel_->try_pop(batch)) {
            for (auto &record : batch) {
                consume(std::move(record));
            }
            batch.clear();
        }
        if (closed) {
            break;
        }

        boost::asio::steady_timer timer{executor, config_.poll_interval};
        const auto [wait_ec] = co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (wait_ec.failed() && wait_ec != boost::asio::error::operation_aborted) {
            throw boost::system::system_error{wait_ec};
        }
    }

    if (const std::size_t aborted = channel_->aborted_senders(); aborted != 0) {
        log::warn("{} listing tasks did not complete, results may be incomplete", aborted);
    }
    finalize();
    log::info("aggregated {} records, wrote {} results", state_->records_aggregated.load(),
              state_->results_written.load());
}

} // namespace fastlist::engine
