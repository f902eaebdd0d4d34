#pragma once

#include "fastlist/engine/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastlist::engine {

// Streaming two-way set difference over records that arrive in any order.
// A key is settled as soon as both sides have been seen. Until then it is kept in memory,
// so memory grows with the number of keys that are not (yet) present on both sides.
class DiffTable {
private:
    struct Entry {
        std::optional<ObjectMeta> left;
        std::optional<ObjectMeta> right;
    };

    std::unordered_map<std::string, Entry> pending_;
    std::size_t matched_ = 0;
    std::size_t duplicates_ = 0;

public:
    // Returns a Mismatch result once both sides of a key are known and differ.
    [[nodiscard]] std::optional<DiffResult> add(ObjectRecord record);

    // LeftOnly / RightOnly results for every unmatched key. Empties the table.
    [[nodiscard]] std::vector<DiffResult> drain_unmatched();

    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
    // keys seen on both sides, equal or not
    [[nodiscard]] std::size_t matched() const noexcept { return matched_; }
    // records for a key that was already seen on the same side
    [[nodiscard]] std::size_t duplicates() const noexcept { return duplicates_; }
};

} // namespace fastlist::engine
