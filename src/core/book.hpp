#pragma once

#include "core/item.hpp"
#include "core/settings.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace sheaf {

/**
 * BookSnapshot - The whole input of the engine at one instant.
 *
 * Snapshots are values: edits produce a new snapshot rather than patching the
 * current one, so an asynchronous result computed from an older snapshot can
 * be recognised and dropped.
 */
struct BookSnapshot {
    std::string title;
    std::vector<Item> items;
    Settings settings;
    std::string remote_folder_id;

    bool operator==(const BookSnapshot&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline BookSnapshot with_items(BookSnapshot book, std::vector<Item> items) {
    book.items = std::move(items);
    return book;
}

[[nodiscard]] inline BookSnapshot with_settings(BookSnapshot book, const Settings& settings) {
    book.settings = settings;
    return book;
}

[[nodiscard]] inline BookSnapshot with_title(BookSnapshot book, std::string title) {
    book.title = std::move(title);
    return book;
}

[[nodiscard]] inline BookSnapshot with_remote_folder(BookSnapshot book, std::string folder_id) {
    book.remote_folder_id = std::move(folder_id);
    return book;
}

[[nodiscard]] inline std::vector<ItemId> item_ids(const BookSnapshot& book) {
    std::vector<ItemId> ids;
    ids.reserve(book.items.size());
    for (const auto& item : book.items) {
        ids.push_back(item.id);
    }
    return ids;
}

[[nodiscard]] inline const Item* find_item(const BookSnapshot& book, const ItemId& id) {
    auto it = std::find_if(book.items.begin(), book.items.end(),
                           [&](const Item& item) { return item.id == id; });
    return it != book.items.end() ? &*it : nullptr;
}

} // namespace sheaf
