#pragma once

#include <boost/describe/class.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fastlist::engine {

// Which bucket a record was listed from. Only meaningful when diffing.
enum class Direction : std::uint8_t { Left, Right };

[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

struct ObjectMeta {
    std::uint64_t size{};
    std::string etag;
    // as returned by the provider, e.g. 2009-10-12T17:50:30.000Z
    std::string last_modified;
};
BOOST_DESCRIBE_STRUCT(ObjectMeta, (), (size, etag, last_modified));

// Two copies of an object are considered equal if size and ETag match.
// last_modified differs between copies of the same content.
[[nodiscard]] bool same_content(const ObjectMeta &lhs, const ObjectMeta &rhs) noexcept;

struct ObjectRecord {
    std::string key;
    std::uint64_t size{};
    std::string etag;
    std::string last_modified;
    Direction direction = Direction::Left;

    [[nodiscard]] ObjectMeta meta() const { return {.size = size, .etag = etag, .last_modified = last_modified}; }
};
// direction is not part of the serialized form
BOOST_DESCRIBE_STRUCT(ObjectRecord, (), (key, size, etag, last_modified));

using RecordBatch = std::vector<ObjectRecord>;

enum class DiffKind : std::uint8_t { LeftOnly, RightOnly, Mismatch };

// left_only, right_only, mismatch
[[nodiscard]] std::string_view to_string(DiffKind kind) noexcept;

struct DiffResult {
    std::string key;
    DiffKind diff = DiffKind::Mismatch;
    std::optional<ObjectMeta> left;
    std::optional<ObjectMeta> right;
};
BOOST_DESCRIBE_STRUCT(DiffResult, (), (key, diff, left, right));

} // namespace fastlist::engine
