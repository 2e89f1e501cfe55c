#pragma once

#include "core/chunk_planner.hpp"
#include "core/item.hpp"
#include "core/settings.hpp"
#include "encoding/representation.hpp"
#include <map>
#include <optional>
#include <vector>

namespace sheaf::engine {

/**
 * ItemCache - Last compressed representation per item id.
 *
 * A value type. store() and prune() return nothing and touch only the entries
 * they name, so owners can copy the cache before an asynchronous step and
 * compare afterwards.
 */
class ItemCache {
public:
    /**
     * True when there is no entry for the item or the entry was produced under
     * a different compression level.
     */
    [[nodiscard]] bool needs_processing(const Item& item, const Settings& settings) const;

    /**
     * Replace the entry for `id` only.
     */
    void store(const ItemId& id, encoding::CompressedRepresentation representation);

    [[nodiscard]] const encoding::CompressedRepresentation* entry(const ItemId& id) const;

    /**
     * Cached size when current, raw size otherwise.
     */
    [[nodiscard]] int64_t best_known_size(const Item& item, const Settings& settings) const;

    /**
     * Page count from the item itself, or from the cache entry when the item
     * did not carry one.
     */
    [[nodiscard]] std::optional<int> page_count(const Item& item) const;

    /**
     * Fraction of `items` whose entry is current. 1.0 for an empty book.
     */
    [[nodiscard]] double progress(const std::vector<Item>& items, const Settings& settings) const;

    /**
     * Drop entries whose id is no longer in `items`.
     */
    void prune(const std::vector<Item>& items);

    /**
     * The planner's view of `items`.
     */
    [[nodiscard]] std::vector<PlannerItem> planner_items(const std::vector<Item>& items,
                                                         const Settings& settings) const;

    /**
     * Items paired with their cache entries, as the bundle encoder takes them.
     */
    [[nodiscard]] encoding::BundleItems bundle_items(const std::vector<Item>& items) const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::map<ItemId, encoding::CompressedRepresentation> entries_;
};

} // namespace sheaf::engine
