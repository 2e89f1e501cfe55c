#pragma once

#include "core/book.hpp"
#include "core/chunk.hpp"
#include "engine/sync_engine.hpp"
#include <QString>

namespace sheaf::cli {

struct PlanReportOptions {
    bool includeIds = false;
    bool includeItems = true;
};

// "12.10 MB" (binary megabytes, two decimals).
[[nodiscard]] QString format_megabytes(int64_t bytes);

// Pure formatter: one line per part, items indented beneath it.
[[nodiscard]] QString format_plan(const BookSnapshot& book,
                                  const ChunkPlan& plan,
                                  const PlanReportOptions& options = {});

// JSON output:
// {
//   "title", "effectiveLimit", "compressionLevel",
//   "chunks": [{ "partNumber", "title", "itemIds", "estimatedSizeBytes",
//                "verifiedSizeBytes", "fingerprint", "oversized", "fullyOptimized" }],
//   "violations": [{ "partNumber", "itemId", "verifiedSizeBytes", "effectiveLimit" }]
// }
[[nodiscard]] QString format_plan_json(const BookSnapshot& book, const ChunkPlan& plan);

// One line per record: "Part 2: dirty (attempts 3) - <last error>".
[[nodiscard]] QString format_sync_records(const engine::SyncRecords& records);

} // namespace sheaf::cli
