#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace fastlist::engine {

// Compiled key predicate.
//   prefix:<p>     keys starting with p
//   suffix:<s>     keys ending with s
//   glob:<pattern> fnmatch(3) without flags, so '*' also matches '/'
//   <pattern>      same as glob:<pattern>
class KeyFilter {
public:
    enum class Kind : std::uint8_t { Prefix, Suffix, Glob };

private:
    Kind kind_;
    std::string pattern_;

    [[nodiscard]] KeyFilter(Kind kind, std::string pattern) : kind_{kind}, pattern_{std::move(pattern)} {}

public:
    // Throws std::invalid_argument for an empty pattern or an unterminated bracket expression.
    [[nodiscard]] static KeyFilter compile(std::string_view expression);

    [[nodiscard]] bool matches(const std::string &key) const;

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string &pattern() const { return pattern_; }
};

} // namespace fastlist::engine
