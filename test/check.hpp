#pragma once

#include <iostream>
#include <print>
#include <source_location>
#include <string_view>

namespace fastlist::test {

inline int &failure_count() {
    static int count = 0;
    return count;
}

// Logs and counts a failed condition, the test keeps going.
inline bool check(bool condition, std::string_view what,
                  const std::source_location location = std::source_location::current()) {
    if (!condition) {
        std::println(std::cerr, "{}:{}: check failed: {}", location.file_name(), location.line(), what);
        failure_count()++;
    }
    return condition;
}

[[nodiscard]] inline int exit_code() { return failure_count() == 0 ? 0 : 1; }

} // namespace fastlist::test
