#pragma once

#include <cstddef>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fastlist::engine {

// Half-open key range [start, end). An absent bound is unbounded on that side.
class KeyRange {
private:
    std::optional<std::string> start_;
    std::optional<std::string> end_;

public:
    [[nodiscard]] KeyRange() = default;
    [[nodiscard]] KeyRange(std::optional<std::string> start, std::optional<std::string> end)
        : start_{std::move(start)}, end_{std::move(end)} {}

    [[nodiscard]] const std::optional<std::string> &start() const { return start_; }
    [[nodiscard]] const std::optional<std::string> &end() const { return end_; }

    [[nodiscard]] bool before_start(std::string_view key) const { return start_.has_value() && key < *start_; }
    [[nodiscard]] bool at_or_past_end(std::string_view key) const { return end_.has_value() && key >= *end_; }
    [[nodiscard]] bool contains(std::string_view key) const { return !before_start(key) && !at_or_past_end(key); }

    // The part of this range holding keys that begin with prefix, or nullopt if there is none.
    // Bounds that do not begin with prefix are implied by it and dropped.
    [[nodiscard]] std::optional<KeyRange> narrow_to_prefix(std::string_view prefix) const;

    // start-after value that makes a listing begin just before start: the last code point of start
    // decremented and followed by U+10FFFF. If that code point is U+0000 or not valid UTF-8 it is
    // dropped instead, and the listing begins further back. Keys before start still have to be skipped.
    [[nodiscard]] std::optional<std::string> start_after() const;

    [[nodiscard]] bool operator==(const KeyRange &) const = default;
};

// Partition of the key space from sorted, deduplicated prefixes h0 < h1 < ... < h(n-1):
// [-, h1), [h1, h2), ..., [h(n-2), -). Fewer than three prefixes yield the single range [-, -).
class KeySpaceHints {
private:
    std::vector<KeyRange> ranges_;

public:
    // Throws std::invalid_argument if prefixes is not strictly increasing.
    [[nodiscard]] explicit KeySpaceHints(const std::vector<std::string> &prefixes = {});

    [[nodiscard]] const std::vector<KeyRange> &ranges() const { return ranges_; }
    [[nodiscard]] std::size_t size() const { return ranges_.size(); }

    [[nodiscard]] bool operator==(const KeySpaceHints &) const = default;
};

// One prefix per line. Empty lines and lines containing NUL are skipped, CRLF is accepted.
// The result is sorted and deduplicated. A missing file yields an empty list.
// Throws std::runtime_error if the file exists but cannot be read.
[[nodiscard]] std::vector<std::string> load_hints_file(const std::filesystem::path &path);

} // namespace fastlist::engine

template <> struct std::formatter<fastlist::engine::KeyRange> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const fastlist::engine::KeyRange &range, std::format_context &ctx) {
        return std::format_to(ctx.out(), "[{}, {})", range.start().value_or("-"), range.end().value_or("-"));
    }
};
