#include "fastlist/engine/key_filter.hpp"

#include <cstddef>
#include <fnmatch.h>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::engine {

namespace {

// fnmatch treats an unterminated '[' as a literal on glibc but not everywhere
[[nodiscard]] bool has_unterminated_bracket(std::string_view pattern) {
    for (std::size_t i = 0; i < pattern.size(); i++) {
        if (pattern[i] == '\\') {
            i++;
            continue;
        }
        if (pattern[i] != '[') {
            continue;
        }
        std::size_t j = i + 1;
        if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
            j++;
        }
        // a ']' right after the opening bracket is part of the set
        if (j < pattern.size() && pattern[j] == ']') {
            j++;
        }
        while (j < pattern.size() && pattern[j] != ']') {
            j++;
        }
        if (j >= pattern.size()) {
            return true;
        }
        i = j;
    }
    return false;
}

} // namespace

KeyFilter KeyFilter::compile(std::string_view expression) {
    Kind kind = Kind::Glob;
    std::string_view pattern = expression;
    if (expression.starts_with("prefix:")) {
        kind = Kind::Prefix;
        pattern.remove_prefix(std::string_view{"prefix:"}.size());
    } else if (expression.starts_with("suffix:")) {
        kind = Kind::Suffix;
        pattern.remove_prefix(std::string_view{"suffix:"}.size());
    } else if (expression.starts_with("glob:")) {
        pattern.remove_prefix(std::string_view{"glob:"}.size());
    }

    if (pattern.empty()) {
        throw std::invalid_argument{std::format("filter expression '{}' has an empty pattern", expression)};
    }
    if (kind == Kind::Glob && has_unterminated_bracket(pattern)) {
        throw std::invalid_argument{
            std::format("filter expression '{}' has an unterminated bracket expression", expression)};
    }
    return {kind, std::string{pattern}};
}

bool KeyFilter::matches(const std::string &key) const {
    switch (kind_) {
    case Kind::Prefix:
        return key.starts_with(pattern_);
    case Kind::Suffix:
        return key.ends_with(pattern_);
    case Kind::Glob:
        return ::fnmatch(pattern_.c_str(), key.c_str(), 0) == 0;
    }
    return false;
}

} // namespace fastlist::engine
