#pragma once

#include "core/book.hpp"
#include "core/chunk.hpp"
#include "core/result.hpp"
#include "engine/item_cache.hpp"

namespace sheaf::cli {

/**
 * Compress every item of `book` into `cache`, then plan synchronously with
 * the Qt encoder. The first compression or verification error is returned.
 */
[[nodiscard]] Result<ChunkPlan, Error> plan_offline(const BookSnapshot& book, engine::ItemCache& cache);

} // namespace sheaf::cli
