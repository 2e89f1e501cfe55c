#pragma once

#include "core/item.hpp"
#include "core/types.hpp"
#include <QByteArray>
#include <cstdint>
#include <optional>
#include <vector>

namespace sheaf::encoding {

/**
 * CompressedBytes - Output of compressing a single item.
 */
struct CompressedBytes {
    QByteArray bytes;
    int64_t size = 0;
};

/**
 * CompressedRepresentation - A cache entry: compressed bytes plus the level
 * they were produced under.
 */
struct CompressedRepresentation {
    QByteArray bytes;
    int64_t size = 0;
    CompressionLevel level = CompressionLevel::Low;
    std::optional<int> page_count;

    bool operator==(const CompressedRepresentation& other) const {
        return size == other.size && level == other.level &&
               page_count == other.page_count && bytes == other.bytes;
    }
};

/**
 * BundleItem - An item as handed to the bundle encoder, with whatever cached
 * representation is available for it.
 */
struct BundleItem {
    Item item;
    std::optional<CompressedRepresentation> cached;
};

using BundleItems = std::vector<BundleItem>;

} // namespace sheaf::encoding
