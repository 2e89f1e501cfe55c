#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sheaf {

/**
 * Chunk - A contiguous run of book items exported as one bundle.
 *
 * Derived data: a planning pass creates every chunk and the next pass replaces
 * them all.
 */
struct Chunk {
    int part_number = 0;
    std::vector<ItemId> item_ids;
    std::vector<int64_t> item_sizes;  // Best-known size of each item when planned
    std::string title;
    int64_t estimated_size_bytes = 0;
    int64_t verified_size_bytes = 0;
    std::string content_fingerprint;
    bool oversized = false;
    bool fully_optimized = false;  // Every item had a current compressed representation

    bool operator==(const Chunk&) const = default;
};

/**
 * OversizedItemError - A single item that cannot fit under the effective limit.
 *
 * Needs a decision from the user (higher compression or removing the item).
 */
struct OversizedItemError {
    int part_number = 0;
    ItemId item_id;
    int64_t verified_size_bytes = 0;
    int64_t effective_limit = 0;

    bool operator==(const OversizedItemError&) const = default;
};

/**
 * ChunkPlan - Ordered chunks covering the whole item sequence.
 */
struct ChunkPlan {
    std::vector<Chunk> chunks;
    int64_t effective_limit = 0;

    [[nodiscard]] bool empty() const noexcept { return chunks.empty(); }
    [[nodiscard]] size_t size() const noexcept { return chunks.size(); }

    [[nodiscard]] std::vector<OversizedItemError> violations() const {
        std::vector<OversizedItemError> out;
        for (const auto& chunk : chunks) {
            if (!chunk.oversized || chunk.item_ids.empty()) continue;
            out.push_back(OversizedItemError{
                .part_number = chunk.part_number,
                .item_id = chunk.item_ids.front(),
                .verified_size_bytes = chunk.verified_size_bytes,
                .effective_limit = effective_limit,
            });
        }
        return out;
    }

    /**
     * Ok when every chunk verified under the limit, otherwise an OversizedItem
     * error naming the first offending item.
     */
    [[nodiscard]] Result<void, Error> check_constraints() const {
        const auto found = violations();
        if (found.empty()) {
            return Result<void, Error>::ok();
        }
        const auto& first = found.front();
        return Result<void, Error>::err(Error{
            "item " + first.item_id + " encodes to " + std::to_string(first.verified_size_bytes) +
                " bytes, above the limit of " + std::to_string(first.effective_limit),
            ErrorKind::OversizedItem});
    }

    [[nodiscard]] std::vector<ItemId> concatenated_item_ids() const {
        std::vector<ItemId> ids;
        for (const auto& chunk : chunks) {
            ids.insert(ids.end(), chunk.item_ids.begin(), chunk.item_ids.end());
        }
        return ids;
    }

    bool operator==(const ChunkPlan&) const = default;
};

} // namespace sheaf
