#pragma once

#include "fastlist/engine/record.hpp"

#include <atomic>
#include <boost/lockfree/stack.hpp>
#include <cstddef>
#include <memory>

namespace fastlist::engine {

class RecordSender;

// Multi-producer, single-consumer channel of record batches.
// The channel is closed once every RecordSender has been released. Batches are not ordered.
class RecordChannel : public std::enable_shared_from_this<RecordChannel> {
private:
    friend class RecordSender;

    boost::lockfree::stack<RecordBatch> stack_{1024};
    std::atomic<std::size_t> senders_{0};
    std::atomic<std::size_t> aborted_{0};

public:
    [[nodiscard]] RecordChannel() = default;
    RecordChannel(const RecordChannel &) = delete;
    RecordChannel &operator=(const RecordChannel &) = delete;

    // The channel must be owned by a shared_ptr.
    [[nodiscard]] RecordSender make_sender();

    // Once true, stays true, and every batch sent before is visible to try_pop.
    [[nodiscard]] bool closed() const noexcept { return senders_.load() == 0; }

    // Senders released without finish(). Non-zero means some producer did not complete.
    [[nodiscard]] std::size_t aborted_senders() const noexcept { return aborted_.load(); }

    [[nodiscard]] bool try_pop(RecordBatch &batch) { return stack_.pop(batch); }
};

// Producer handle. Copies count as separate senders.
class RecordSender {
private:
    std::shared_ptr<RecordChannel> channel_;
    bool finished_ = false;

public:
    [[nodiscard]] RecordSender() = default;
    [[nodiscard]] explicit RecordSender(std::shared_ptr<RecordChannel> channel);
    ~RecordSender() { release(); }

    [[nodiscard]] RecordSender(const RecordSender &other);
    RecordSender &operator=(const RecordSender &other);
    [[nodiscard]] RecordSender(RecordSender &&other) noexcept;
    RecordSender &operator=(RecordSender &&other) noexcept;

    // Throws std::logic_error after release().
    void send(RecordBatch batch) const;

    // Marks the producer as complete. Releasing a finished sender is not counted as aborted.
    void finish() noexcept { finished_ = true; }

    void release() noexcept;

    [[nodiscard]] bool valid() const noexcept { return channel_ != nullptr; }
};

} // namespace fastlist::engine
