#include "fastlist/engine/diff_table.hpp"

#include "fastlist/engine/record.hpp"
#include "fastlist/log.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace fastlist::engine {

std::optional<DiffResult> DiffTable::add(ObjectRecord record) {
    ObjectMeta meta = record.meta();
    const Direction direction = record.direction;

    auto [it, inserted] = pending_.try_emplace(std::move(record.key));
    Entry &entry = it->second;
    std::optional<ObjectMeta> &own = direction == Direction::Left ? entry.left : entry.right;
    const std::optional<ObjectMeta> &other = direction == Direction::Left ? entry.right : entry.left;

    if (own.has_value()) {
        duplicates_++;
        log::debug("key {} listed twice on the {} side", it->first, to_string(direction));
    }
    own = std::move(meta);
    if (!other.has_value()) {
        return std::nullopt;
    }

    matched_++;
    std::optional<DiffResult> ret;
    if (!same_content(*entry.left, *entry.right)) {
        ret = DiffResult{.key = it->first,
                         .diff = DiffKind::Mismatch,
                         .left = std::move(entry.left),
                         .right = std::move(entry.right)};
    }
    pending_.erase(it);
    return ret;
}

std::vector<DiffResult> DiffTable::drain_unmatched() {
    std::vector<DiffResult> ret;
    ret.reserve(pending_.size());
    for (auto &[key, entry] : pending_) {
        ret.push_back({.key = key,
                       .diff = entry.left.has_value() ? DiffKind::LeftOnly : DiffKind::RightOnly,
                       .left = std::move(entry.left),
                       .right = std::move(entry.right)});
    }
    pending_.clear();
    return ret;
}

} // namespace fastlist::engine
