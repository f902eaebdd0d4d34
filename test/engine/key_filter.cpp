#include "../check.hpp"
#include "fastlist/engine/key_filter.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

using fastlist::test::check;
using fastlist::engine::KeyFilter;

namespace {

[[nodiscard]] bool rejected(std::string_view expression) {
    try {
        static_cast<void>(KeyFilter::compile(expression));
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    const auto prefix = KeyFilter::compile("prefix:logs/2024/");
    check(prefix.kind() == KeyFilter::Kind::Prefix && prefix.pattern() == "logs/2024/", "prefix parsed");
    check(prefix.matches("logs/2024/01/a.gz"), "prefix match");
    check(!prefix.matches("logs/2023/01/a.gz"), "prefix mismatch");

    const auto suffix = KeyFilter::compile("suffix:.parquet");
    check(suffix.kind() == KeyFilter::Kind::Suffix, "suffix parsed");
    check(suffix.matches("data/part-0.parquet"), "suffix match");
    check(!suffix.matches("data/part-0.parquet.tmp"), "suffix mismatch");

    const auto glob = KeyFilter::compile("glob:*/2024-??-*.csv");
    check(glob.kind() == KeyFilter::Kind::Glob, "glob parsed");
    check(glob.matches("exports/daily/2024-05-01.csv"), "star crosses slashes");
    check(!glob.matches("exports/daily/2023-05-01.csv"), "glob mismatch");

    const auto bare = KeyFilter::compile("*.[jJ][pP][gG]");
    check(bare.kind() == KeyFilter::Kind::Glob, "bare pattern is a glob");
    check(bare.matches("photos/a.JPG") && bare.matches("b.jpg"), "bracket sets");
    check(!bare.matches("photos/a.png"), "bracket set mismatch");

    check(KeyFilter::compile("[]a]*").matches("]x"), "leading bracket in a set");
    check(KeyFilter::compile("prefix:[").matches("[x"), "prefix patterns are literal");

    check(rejected(""), "empty expression");
    check(rejected("prefix:"), "empty prefix");
    check(rejected("glob:"), "empty glob");
    check(rejected("data/[abc"), "unterminated bracket");
    check(!rejected("data/\\[abc"), "escaped bracket");

    return fastlist::test::exit_code();
}
