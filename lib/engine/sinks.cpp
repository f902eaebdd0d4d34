#include "fastlist/engine/sinks.hpp"

#include "fastlist/engine/record.hpp"
#include "fastlist/meta.hpp"

#include <algorithm>
#include <boost/describe/members.hpp>
#include <boost/describe/modifiers.hpp>
#include <boost/json/conversion.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/mp11/algorithm.hpp>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// tag_invoke is found through ADL, so the overloads have to live next to the types

namespace fastlist::engine {

namespace {

template <typename T> void described_to_json(boost::json::value &value, const T &object) {
    auto &json_obj = value.emplace_object();
    boost::mp11::mp_for_each<boost::describe::describe_members<T, boost::describe::mod_public>>([&](auto member) {
        // NOLINTNEXTLINE(readability-static-accessed-through-instance)
        if constexpr (meta::is_specialization_v<std::remove_cvref_t<decltype(object.*member.pointer)>,
                                                std::optional>) {
            // absent side of a diff result
            if (!(object.*member.pointer).has_value()) {
                return;
            }
        }
        json_obj[member.name] = boost::json::value_from(object.*member.pointer);
    });
}

void check_stream(const std::ostream &out) {
    if (!out) {
        throw std::runtime_error{std::format("failed to write output: {}", std::strerror(errno))};
    }
}

} // namespace

[[maybe_unused]] static inline void
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
tag_invoke([[maybe_unused]] const boost::json::value_from_tag &tag, boost::json::value &value, DiffKind kind) {
    value = to_string(kind);
}

[[maybe_unused]] static inline void
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
tag_invoke([[maybe_unused]] const boost::json::value_from_tag &tag, boost::json::value &value,
           const ObjectMeta &meta) {
    described_to_json(value, meta);
}

[[maybe_unused]] static inline void
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
tag_invoke([[maybe_unused]] const boost::json::value_from_tag &tag, boost::json::value &value,
           const ObjectRecord &record) {
    described_to_json(value, record);
}

[[maybe_unused]] static inline void
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
tag_invoke([[maybe_unused]] const boost::json::value_from_tag &tag, boost::json::value &value,
           const DiffResult &result) {
    described_to_json(value, result);
}

std::unique_ptr<std::ostream> open_output(const std::filesystem::path &path) {
    auto ret = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!*ret) {
        throw std::runtime_error{std::format("failed to open {}: {}", path.string(), std::strerror(errno))};
    }
    return ret;
}

void PlainSink::write(const ObjectRecord &record) {
    *out_ << record.key << '\n';
    check_stream(*out_);
}

void PlainSink::write(const DiffResult &result) {
    *out_ << to_string(result.diff) << '\t' << result.key << '\n';
    check_stream(*out_);
}

void PlainSink::flush() {
    out_->flush();
    check_stream(*out_);
}

void JsonSink::write(const ObjectRecord &record) {
    *out_ << boost::json::serialize(boost::json::value_from(record)) << '\n';
    check_stream(*out_);
}

void JsonSink::write(const DiffResult &result) {
    *out_ << boost::json::serialize(boost::json::value_from(result)) << '\n';
    check_stream(*out_);
}

void JsonSink::flush() {
    out_->flush();
    check_stream(*out_);
}

KeySpaceSampler::KeySpaceSampler(std::unique_ptr<std::ostream> out, std::size_t every)
    : out_{std::move(out)}, every_{every} {
    if (every_ == 0) {
        throw std::invalid_argument{"key space sample interval must be at least 1"};
    }
}

void KeySpaceSampler::write(const ObjectRecord &record) {
    // records arrive in no particular order, so pick by key instead of by position
    if (std::hash<std::string>{}(record.key) % every_ == 0) {
        keys_.push_back(record.key);
    }
}

void KeySpaceSampler::write([[maybe_unused]] const DiffResult &result) {}

void KeySpaceSampler::flush() {
    std::ranges::sort(keys_);
    const auto [first, last] = std::ranges::unique(keys_);
    keys_.erase(first, last);
    for (const auto &key : keys_) {
        *out_ << key << '\n';
    }
    keys_.clear();
    out_->flush();
    check_stream(*out_);
}

} // namespace fastlist::engine
