#pragma once

#include "core/types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace sheaf {

/**
 * Item - One media file in a book.
 *
 * Identity, order and removal are decided by the user; the compressed
 * representation lives in the ItemCache, not here.
 */
struct Item {
    ItemId id;
    std::string name;
    ItemKind kind = ItemKind::Image;
    int64_t raw_size = 0;
    std::string source_path;
    std::optional<int> page_count;  // Authoritative count when known up front

    bool operator==(const Item&) const = default;
};

[[nodiscard]] inline bool needs_page_count(const Item& item) {
    return is_multi_page(item.kind) && !item.page_count.has_value();
}

} // namespace sheaf
