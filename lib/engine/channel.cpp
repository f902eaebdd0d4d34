#include "fastlist/engine/channel.hpp"

#include "fastlist/engine/record.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace fastlist::engine {

RecordSender RecordChannel::make_sender() { return RecordSender{shared_from_this()}; }

RecordSender::RecordSender(std::shared_ptr<RecordChannel> channel) : channel_{std::move(channel)} {
    if (channel_) {
        channel_->senders_++;
    }
}

RecordSender::RecordSender(const RecordSender &other) : channel_{other.channel_} {
    if (channel_) {
        channel_->senders_++;
    }
}

RecordSender &RecordSender::operator=(const RecordSender &other) {
    if (this != &other) {
        release();
        channel_ = other.channel_;
        finished_ = false;
        if (channel_) {
            channel_->senders_++;
        }
    }
    return *this;
}

RecordSender::RecordSender(RecordSender &&other) noexcept
    : channel_{std::move(other.channel_)}, finished_{std::exchange(other.finished_, false)} {}

RecordSender &RecordSender::operator=(RecordSender &&other) noexcept {
    if (this != &other) {
        release();
        channel_ = std::move(other.channel_);
        finished_ = std::exchange(other.finished_, false);
    }
    return *this;
}

void RecordSender::send(RecordBatch batch) const {
    if (!channel_) {
        throw std::logic_error{"send on a released RecordSender"};
    }
    if (!channel_->stack_.push(std::move(batch))) {
        throw std::runtime_error{"record channel is out of nodes"};
    }
}

void RecordSender::release() noexcept {
    if (!channel_) {
        return;
    }
    if (!finished_) {
        channel_->aborted_++;
    }
    // the decrement publishes every push made through this sender
    channel_->senders_--;
    channel_.reset();
    finished_ = false;
}

} // namespace fastlist::engine
