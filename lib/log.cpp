#include "fastlist/log.hpp"

#include <atomic>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::log {

namespace {

struct Logger {
    std::atomic<Level> level{Level::INFO};
    std::mutex mutex;
    std::unique_ptr<std::ofstream> file;
};

Logger &logger() {
    static Logger instance;
    return instance;
}

constexpr std::string_view level_name(Level level) {
    switch (level) {
    case Level::ERROR:
        return "ERROR";
    case Level::WARN:
        return "WARN ";
    case Level::INFO:
        return "INFO ";
    case Level::DEBUG:
        return "DEBUG";
    }
    return "?????";
}

} // namespace

std::optional<Level> parse_level(std::string_view name) {
    std::string lower{name};
    boost::algorithm::trim(lower);
    boost::algorithm::to_lower(lower);
    if (lower == "error") {
        return Level::ERROR;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::WARN;
    }
    if (lower == "info") {
        return Level::INFO;
    }
    if (lower == "debug" || lower == "trace") {
        return Level::DEBUG;
    }
    return std::nullopt;
}

void init(Level level, const std::optional<std::filesystem::path> &file) {
    Logger &instance = logger();
    const std::scoped_lock lock{instance.mutex};
    instance.level = level;
    if (file.has_value()) {
        auto stream = std::make_unique<std::ofstream>(*file, std::ios::out | std::ios::app);
        if (!stream->is_open()) {
            throw std::runtime_error{std::format("unable to open log file {}", file->string())};
        }
        instance.file = std::move(stream);
    } else {
        instance.file.reset();
    }
}

bool enabled(Level level) noexcept { return level <= logger().level.load(std::memory_order_relaxed); }

void write(Level level, std::string_view message) {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    Logger &instance = logger();
    const std::scoped_lock lock{instance.mutex};
    if (instance.file != nullptr) {
        std::println(*instance.file, "[{:%FT%TZ} {}] {}", now, level_name(level), message);
        instance.file->flush();
    } else {
        std::println(std::cerr, "[{:%FT%TZ} {}] {}", now, level_name(level), message);
    }
}

} // namespace fastlist::log
