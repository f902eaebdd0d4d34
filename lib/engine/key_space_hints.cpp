#include "fastlist/engine/key_space_hints.hpp"

#include "fastlist/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fastlist::engine {

namespace {

// U+10FFFF, the largest code point
constexpr std::string_view max_code_point = "\xf4\x8f\xbf\xbf";

struct CodePoint {
    std::size_t offset = 0;
    char32_t value = 0;
};

// nullopt if key does not end in a well-formed UTF-8 sequence
[[nodiscard]] std::optional<CodePoint> last_code_point(std::string_view key) {
    std::size_t offset = key.size();
    while (offset > 0 && key.size() - offset < 4) {
        offset--;
        if ((static_cast<unsigned char>(key[offset]) & 0xC0U) != 0x80U) {
            break;
        }
    }
    const std::string_view tail = key.substr(offset);
    const auto lead = static_cast<unsigned char>(tail.front());

    std::size_t length = 0;
    char32_t value = 0;
    if (lead < 0x80U) {
        length = 1;
        value = lead;
    } else if ((lead & 0xE0U) == 0xC0U) {
        length = 2;
        value = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3;
        value = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        length = 4;
        value = lead & 0x07U;
    } else {
        return std::nullopt;
    }
    if (tail.size() != length) {
        return std::nullopt;
    }
    for (const char byte : tail.substr(1)) {
        value = (value << 6U) | (static_cast<unsigned char>(byte) & 0x3FU);
    }

    constexpr char32_t min_value[] = {0, 0, 0x80, 0x800, 0x10000};
    if (value < min_value[length] || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return std::nullopt;
    }
    return CodePoint{.offset = offset, .value = value};
}

void append_utf8(std::string &out, char32_t value) {
    if (value < 0x80) {
        out.push_back(static_cast<char>(value));
    } else if (value < 0x800) {
        out.push_back(static_cast<char>(0xC0U | (value >> 6U)));
        out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
    } else if (value < 0x10000) {
        out.push_back(static_cast<char>(0xE0U | (value >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((value >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (value >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((value >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((value >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
    }
}

} // namespace

std::optional<KeyRange> KeyRange::narrow_to_prefix(std::string_view prefix) const {
    // every key under prefix sorts at or after prefix
    if (end_.has_value() && prefix >= *end_) {
        return std::nullopt;
    }
    const bool start_under_prefix = start_.has_value() && start_->starts_with(prefix);
    // prefix sorts before start and start is not below it: every key under prefix sorts before start
    if (start_.has_value() && prefix < *start_ && !start_under_prefix) {
        return std::nullopt;
    }
    const bool end_under_prefix = end_.has_value() && end_->starts_with(prefix);
    return KeyRange{start_under_prefix ? start_ : std::nullopt, end_under_prefix ? end_ : std::nullopt};
}

std::optional<std::string> KeyRange::start_after() const {
    if (!start_.has_value() || start_->empty()) {
        return std::nullopt;
    }

    if (const auto last = last_code_point(*start_); last.has_value() && last->value != 0) {
        char32_t previous = last->value - 1;
        if (previous >= 0xD800 && previous <= 0xDFFF) {
            previous = 0xD7FF;
        }
        std::string ret = start_->substr(0, last->offset);
        append_utf8(ret, previous);
        ret.append(max_code_point);
        return ret;
    }

    // U+0000 or malformed tail: drop it and accept re-listing from the shorter key
    std::string ret = *start_;
    while (!ret.empty() && (static_cast<unsigned char>(ret.back()) & 0xC0U) == 0x80U) {
        ret.pop_back();
    }
    if (!ret.empty()) {
        ret.pop_back();
    }
    if (ret.empty()) {
        return std::nullopt;
    }
    return ret;
}

KeySpaceHints::KeySpaceHints(const std::vector<std::string> &prefixes) {
    if (std::ranges::adjacent_find(prefixes, std::ranges::greater_equal{}) != prefixes.end()) {
        throw std::invalid_argument{"key space hints must be sorted and free of duplicates"};
    }

    if (prefixes.size() < 3) {
        ranges_.emplace_back();
        return;
    }

    const std::size_t last = prefixes.size() - 2;
    ranges_.reserve(last + 1);
    for (std::size_t i = 0; i <= last; i++) {
        ranges_.emplace_back(i == 0 ? std::nullopt : std::optional<std::string>{prefixes[i]},
                             i == last ? std::nullopt : std::optional<std::string>{prefixes[i + 1]});
    }
}

std::vector<std::string> load_hints_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log::info("no key space hints at {}, listing without hints", path.string());
        return {};
    }

    std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{
            std::format("failed to open hints file {}: {}", path.string(), std::strerror(errno))};
    }

    std::vector<std::string> ret;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(stream, line)) {
        line_no++;
        if (line.ends_with('\r')) {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (line.find('\0') != std::string::npos) {
            log::warn("skipping malformed line {} in hints file {}", line_no, path.string());
            continue;
        }
        ret.push_back(std::move(line));
    }
    if (stream.bad()) {
        throw std::runtime_error{std::format("failed to read hints file {}", path.string())};
    }

    std::ranges::sort(ret);
    const auto [first, last] = std::ranges::unique(ret);
    ret.erase(first, last);
    return ret;
}

} // namespace fastlist::engine
