#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::log {

enum class Level : std::uint8_t { ERROR, WARN, INFO, DEBUG };

// Parses "error", "warn", "info" or "debug" (case-insensitive). Returns nullopt for anything else.
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

// Configures the process-wide logger. Without a file, log lines go to stderr.
// Throws std::runtime_error if the log file cannot be opened.
void init(Level level, const std::optional<std::filesystem::path> &file = std::nullopt);

[[nodiscard]] bool enabled(Level level) noexcept;

void write(Level level, std::string_view message);

template <typename... Args> void error(std::format_string<Args...> fmt, Args &&...args) {
    write(Level::ERROR, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args> void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::WARN)) {
        write(Level::WARN, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void info(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::INFO)) {
        write(Level::INFO, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args> void debug(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::DEBUG)) {
        write(Level::DEBUG, std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace fastlist::log
