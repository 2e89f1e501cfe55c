#include "engine/item_cache.hpp"

#include <set>

namespace sheaf::engine {

bool ItemCache::needs_processing(const Item& item, const Settings& settings) const {
    const auto* cached = entry(item.id);
    return cached == nullptr || cached->level != settings.compression_level;
}

void ItemCache::store(const ItemId& id, encoding::CompressedRepresentation representation) {
    entries_.insert_or_assign(id, std::move(representation));
}

const encoding::CompressedRepresentation* ItemCache::entry(const ItemId& id) const {
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second : nullptr;
}

int64_t ItemCache::best_known_size(const Item& item, const Settings& settings) const {
    if (needs_processing(item, settings)) {
        return item.raw_size;
    }
    return entry(item.id)->size;
}

std::optional<int> ItemCache::page_count(const Item& item) const {
    if (item.page_count) {
        return item.page_count;
    }
    if (const auto* cached = entry(item.id)) {
        return cached->page_count;
    }
    return std::nullopt;
}

double ItemCache::progress(const std::vector<Item>& items, const Settings& settings) const {
    if (items.empty()) {
        return 1.0;
    }
    size_t current = 0;
    for (const auto& item : items) {
        if (!needs_processing(item, settings)) {
            ++current;
        }
    }
    return static_cast<double>(current) / static_cast<double>(items.size());
}

void ItemCache::prune(const std::vector<Item>& items) {
    std::set<ItemId> live;
    for (const auto& item : items) {
        live.insert(item.id);
    }
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (live.count(it->first) == 0) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<PlannerItem> ItemCache::planner_items(const std::vector<Item>& items,
                                                  const Settings& settings) const {
    std::vector<PlannerItem> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        const bool current = !needs_processing(item, settings);
        out.push_back(PlannerItem{
            .id = item.id,
            .estimated_bytes = current ? entry(item.id)->size : item.raw_size,
            .optimized = current,
        });
    }
    return out;
}

encoding::BundleItems ItemCache::bundle_items(const std::vector<Item>& items) const {
    encoding::BundleItems out;
    out.reserve(items.size());
    for (const auto& item : items) {
        encoding::BundleItem bundle_item{.item = item, .cached = std::nullopt};
        if (const auto* cached = entry(item.id)) {
            bundle_item.cached = *cached;
        }
        if (!bundle_item.item.page_count) {
            bundle_item.item.page_count = page_count(item);
        }
        out.push_back(std::move(bundle_item));
    }
    return out;
}

} // namespace sheaf::engine
