#include "fastlist/engine/lister.hpp"

#include "fastlist/engine/key_space_hints.hpp"
#include "fastlist/engine/listing_client.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/log.hpp"
#include "fastlist/meta.hpp"

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::engine {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

constexpr std::string_view delimiter = "/";

} // namespace

std::chrono::milliseconds RetryPolicy::delay(unsigned attempt) const {
    std::chrono::milliseconds ret = initial_delay;
    for (unsigned i = 1; i < attempt && ret < max_delay; i++) {
        ret *= 2;
    }
    return std::min(ret, max_delay);
}

std::string_view to_string(ListerOutcome outcome) noexcept {
    switch (outcome) {
    case ListerOutcome::Running:
        return "running";
    case ListerOutcome::Complete:
        return "complete";
    case ListerOutcome::Partial:
        return "partial";
    case ListerOutcome::Cancelled:
        return "cancelled";
    case ListerOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

Lister::Lister([[maybe_unused]] PrivateTag tag, TaskContext context, ListerConfig config,
               const KeySpaceHints &hints, std::shared_ptr<ListingClient> client)
    : context_{std::move(context)}, config_{std::move(config)}, client_{std::move(client)} {
    if (config_.concurrency == 0) {
        throw std::invalid_argument{"lister concurrency must be at least 1"};
    }
    if (config_.retry.max_attempts == 0) {
        throw std::invalid_argument{"lister retry policy must allow at least one attempt"};
    }
    for (const auto &range : hints.ranges()) {
        if (auto narrowed = range.narrow_to_prefix(config_.prefix); narrowed.has_value()) {
            push({.prefix = config_.prefix, .range = std::move(*narrowed), .depth = 0});
        }
    }
}

std::shared_ptr<Lister> Lister::create(TaskContext context, ListerConfig config, const KeySpaceHints &hints,
                                       std::shared_ptr<ListingClient> client) {
    return std::make_shared<Lister>(PrivateTag{}, std::move(context), std::move(config), hints,
                                    std::move(client));
}

void Lister::push(WorkItem item) {
    const std::scoped_lock lock{queue_mutex_};
    queue_.push(std::move(item));
    pending_++;
}

std::optional<Lister::WorkItem> Lister::pop() {
    const std::scoped_lock lock{queue_mutex_};
    if (queue_.empty()) {
        return std::nullopt;
    }
    WorkItem ret = queue_.top();
    queue_.pop();
    return ret;
}

bool Lister::should_stop() const noexcept { return context_.state->quit_requested() || failed_.load(); }

void Lister::start(const boost::asio::any_io_executor &executor) {
    if (started_.exchange(true)) {
        throw std::logic_error{"Lister::start called twice"};
    }
    log::info("listing {} bucket {} from prefix '{}' with {} workers, {} initial ranges",
              to_string(context_.direction), context_.bucket, config_.prefix, config_.concurrency,
              pending_.load());

    // all workers count as active before the first one can exit
    active_workers_ = config_.concurrency;
    const auto self = shared_from_this();
    for (std::size_t i = 0; i < config_.concurrency; i++) {
        boost::asio::co_spawn(executor, worker(self),
                              [self](const std::exception_ptr &error) { self->worker_exited(error); });
    }
}

meta::task<void> Lister::worker([[maybe_unused]] std::shared_ptr<Lister> self) {
    const auto executor = co_await boost::asio::this_coro::executor;
    const std::chrono::milliseconds max_idle_delay = std::max(config_.max_idle_interval, config_.poll_interval);
    // doubles for every empty look at the queue, reset once there is work again
    std::chrono::milliseconds idle_delay = config_.poll_interval;

    while (!should_stop()) {
        auto item = pop();
        if (!item.has_value()) {
            // in-flight items may still push sub-prefixes
            if (pending_.load() == 0) {
                break;
            }
            idle_wakeups_++;
            boost::asio::steady_timer timer{executor, idle_delay};
            const auto [wait_ec] = co_await timer.async_wait(token);
            if (wait_ec.failed() && wait_ec != boost::asio::error::operation_aborted) {
                throw boost::system::system_error{wait_ec};
            }
            idle_delay = std::min(idle_delay * 2, max_idle_delay);
            continue;
        }
        idle_delay = config_.poll_interval;
        const boost::scope::scope_exit item_done{[this]() { pending_--; }};
        co_await process(std::move(*item));
    }
}

meta::task<void> Lister::process(WorkItem item) {
    const auto &state = context_.state;

    ListRequest request{.bucket = context_.bucket, .prefix = item.prefix, .delimiter = std::string{delimiter}};
    if (item.range.start().has_value() && *item.range.start() > item.prefix) {
        request.start_after = item.range.start_after();
    }

    while (true) {
        if (should_stop()) {
            abandoned_ = true;
            co_return;
        }

        auto page = co_await list_with_retry(request);
        if (!page.has_value()) {
            co_return;
        }
        state->list_ops++;

        bool past_end = false;
        std::size_t listed = 0;
        RecordBatch batch;
        batch.reserve(page->objects.size());
        for (auto &object : page->objects) {
            if (item.range.before_start(object.key)) {
                continue;
            }
            if (item.range.at_or_past_end(object.key)) {
                past_end = true;
                break;
            }
            listed++;
            if (config_.filter && !config_.filter->matches(object.key)) {
                continue;
            }
            batch.push_back({.key = std::move(object.key),
                             .size = object.size,
                             .etag = std::move(object.etag),
                             .last_modified = std::move(object.last_modified),
                             .direction = context_.direction});
        }

        for (auto &common_prefix : page->common_prefixes) {
            if (item.range.at_or_past_end(common_prefix)) {
                past_end = true;
                break;
            }
            if (auto sub_range = item.range.narrow_to_prefix(common_prefix); sub_range.has_value()) {
                push({.prefix = std::move(common_prefix), .range = std::move(*sub_range), .depth = item.depth + 1});
            }
        }

        state->objects_listed += listed;
        if (!batch.empty()) {
            state->objects_matched += batch.size();
            context_.sender.send(std::move(batch));
        }

        if (past_end || !page->next_token.has_value()) {
            break;
        }
        if (page->next_token == request.continuation_token) {
            log::warn("prefix '{}' {} in bucket {} yielded a repeated continuation token, skipping the rest",
                      item.prefix, item.range, context_.bucket);
            ranges_incomplete_++;
            state->ranges_incomplete++;
            break;
        }
        request.continuation_token = std::move(page->next_token);
    }
}

meta::task<std::optional<ListPage>> Lister::list_with_retry(const ListRequest &request) {
    const auto &state = context_.state;

    for (unsigned attempt = 1;; attempt++) {
        auto res = co_await client_->list(request);
        if (res) {
            co_return std::move(res.value());
        }

        const ListError &error = res.error();
        if (error.kind == ListError::Kind::Fatal) {
            log::error("listing prefix '{}' in bucket {} failed: {}", request.prefix, request.bucket,
                       error.message);
            failed_ = true;
            state->report_fatal();
            co_return std::nullopt;
        }
        if (attempt >= config_.retry.max_attempts) {
            log::error("giving up on prefix '{}' in bucket {} after {} attempts: {}", request.prefix,
                       request.bucket, attempt, error.message);
            ranges_incomplete_++;
            state->ranges_incomplete++;
            co_return std::nullopt;
        }

        const std::chrono::milliseconds delay = config_.retry.delay(attempt);
        log::warn("prefix '{}' in bucket {}: {} - retry {} in {}", request.prefix, request.bucket, error.message,
                  attempt, delay);
        state->retries++;
        if (!co_await sleep(delay)) {
            abandoned_ = true;
            co_return std::nullopt;
        }
    }
}

meta::task<bool> Lister::sleep(std::chrono::milliseconds duration) {
    const auto executor = co_await boost::asio::this_coro::executor;
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!should_stop()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            co_return true;
        }
        // wake up regularly so that quit is noticed during long backoffs
        boost::asio::steady_timer timer{
            executor, std::min<std::chrono::steady_clock::duration>(deadline - now, config_.poll_interval)};
        const auto [wait_ec] = co_await timer.async_wait(token);
        if (wait_ec.failed() && wait_ec != boost::asio::error::operation_aborted) {
            throw boost::system::system_error{wait_ec};
        }
    }
    co_return false;
}

void Lister::worker_exited(const std::exception_ptr &error) {
    const boost::scope::scope_exit last_out{[this]() {
        if (--active_workers_ == 0) {
            finish();
        }
    }};
    if (!error) {
        return;
    }
    failed_ = true;
    context_.state->report_fatal();
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &err) {
        log::error("worker listing bucket {} failed: {}", context_.bucket, err.what());
    }
}

void Lister::finish() {
    const auto &state = context_.state;
    const boost::scope::scope_exit mark_done{[&state]() { state->task_done(); }};

    ListerOutcome outcome = ListerOutcome::Complete;
    if (failed_) {
        outcome = ListerOutcome::Failed;
    } else if (abandoned_ || pending_.load() != 0) {
        outcome = ListerOutcome::Cancelled;
    } else if (ranges_incomplete_.load() != 0) {
        outcome = ListerOutcome::Partial;
    }

    if (outcome == ListerOutcome::Complete || outcome == ListerOutcome::Partial) {
        context_.sender.finish();
    }
    context_.sender.release();
    outcome_ = outcome;

    switch (outcome) {
    case ListerOutcome::Complete:
        log::info("listing {} bucket {} complete", to_string(context_.direction), context_.bucket);
        break;
    case ListerOutcome::Partial:
        log::warn("listing {} bucket {} finished, {} ranges incomplete", to_string(context_.direction),
                  context_.bucket, ranges_incomplete_.load());
        break;
    case ListerOutcome::Cancelled:
        log::warn("listing {} bucket {} cancelled, {} ranges not listed", to_string(context_.direction),
                  context_.bucket, pending_.load());
        break;
    case ListerOutcome::Failed:
    case ListerOutcome::Running:
        log::error("listing {} bucket {} failed, results for this side are incomplete",
                   to_string(context_.direction), context_.bucket);
        break;
    }
}

} // namespace fastlist::engine
