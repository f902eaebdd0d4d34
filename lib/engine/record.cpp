#include "fastlist/engine/record.hpp"

#include <string_view>

namespace fastlist::engine {

std::string_view to_string(Direction direction) noexcept {
    switch (direction) {
    case Direction::Left:
        return "left";
    case Direction::Right:
        return "right";
    }
    return "unknown";
}

std::string_view to_string(DiffKind kind) noexcept {
    switch (kind) {
    case DiffKind::LeftOnly:
        return "left_only";
    case DiffKind::RightOnly:
        return "right_only";
    case DiffKind::Mismatch:
        return "mismatch";
    }
    return "unknown";
}

bool same_content(const ObjectMeta &lhs, const ObjectMeta &rhs) noexcept {
    return lhs.size == rhs.size && lhs.etag == rhs.etag;
}

} // namespace fastlist::engine
