#include "cli/offline_plan.hpp"

#include "core/chunk_planner.hpp"
#include "encoding/qt_encoding_gateway.hpp"
#include "engine/fingerprint.hpp"
#include <QDebug>
#include <map>

namespace sheaf::cli {

using encoding::QtEncodingGateway;

Result<ChunkPlan, Error> plan_offline(const BookSnapshot& book, engine::ItemCache& cache) {
    const auto level = book.settings.compression_level;
    for (const auto& item : book.items) {
        if (!cache.needs_processing(item, book.settings)) {
            continue;
        }
        auto compressed = QtEncodingGateway::compress_now(item, level);
        if (compressed.is_err()) {
            return Result<ChunkPlan, Error>::err(compressed.unwrap_err());
        }
        auto bytes = std::move(compressed).unwrap();

        std::optional<int> pages = item.page_count;
        if (needs_page_count(item)) {
            auto counted = QtEncodingGateway::page_count_now(bytes.bytes);
            if (counted.is_ok()) {
                pages = counted.unwrap();
            } else {
                qWarning() << "PLAN: no page count for" << QString::fromStdString(item.id);
            }
        }
        cache.store(item.id, encoding::CompressedRepresentation{
            .bytes = std::move(bytes.bytes),
            .size = bytes.size,
            .level = level,
            .page_count = pages,
        });
    }

    std::map<ItemId, encoding::BundleItem> by_id;
    for (auto& entry : cache.bundle_items(book.items)) {
        by_id.emplace(entry.item.id, std::move(entry));
    }

    auto planned = plan_chunks(cache.planner_items(book.items, book.settings),
                               book.settings,
                               book.title,
                               [&](std::span<const PlannerItem> batch, const std::string& title) {
        encoding::BundleItems items;
        items.reserve(batch.size());
        for (const auto& planner_item : batch) {
            items.push_back(by_id.at(planner_item.id));
        }
        return QtEncodingGateway::encode_now(items, QString::fromStdString(title), level)
            .map([](const QByteArray& bytes) { return static_cast<int64_t>(bytes.size()); });
    });
    return std::move(planned).map([](ChunkPlan plan) { return engine::with_fingerprints(std::move(plan)); });
}

} // namespace sheaf::cli
