#include "cli/plan_report.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace sheaf::cli {

namespace {

[[nodiscard]] QString render_id_suffix(const std::string& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + QString::fromStdString(id) + QStringLiteral(")"))
                      : QString{};
}

[[nodiscard]] QString item_label(const BookSnapshot& book, const ItemId& id) {
    const Item* item = find_item(book, id);
    if (item == nullptr || item->name.empty()) {
        return QString::fromStdString(id);
    }
    return QString::fromStdString(item->name);
}

[[nodiscard]] QString render_chunk_line(const Chunk& chunk) {
    auto line = QStringLiteral("Part %1: %2  %3, %4 item(s)")
                    .arg(chunk.part_number)
                    .arg(QString::fromStdString(chunk.title))
                    .arg(format_megabytes(chunk.verified_size_bytes))
                    .arg(chunk.item_ids.size());
    if (chunk.oversized) {
        line += QStringLiteral("  [OVERSIZED]");
    }
    if (!chunk.fully_optimized) {
        line += QStringLiteral("  [estimate]");
    }
    return line;
}

} // namespace

QString format_megabytes(int64_t bytes) {
    return QString::number(static_cast<double>(bytes) / (1024.0 * 1024.0), 'f', 2) + QStringLiteral(" MB");
}

QString format_plan(const BookSnapshot& book, const ChunkPlan& plan, const PlanReportOptions& options) {
    QStringList out;
    out.append(QStringLiteral("%1: %2 part(s), limit %3, compression %4")
                   .arg(QString::fromStdString(book.title.empty() ? std::string("Untitled") : book.title))
                   .arg(plan.size())
                   .arg(format_megabytes(plan.effective_limit))
                   .arg(QString::fromLatin1(to_string(book.settings.compression_level).data())));

    for (const auto& chunk : plan.chunks) {
        out.append(render_chunk_line(chunk));
        if (!options.includeItems) {
            continue;
        }
        for (size_t i = 0; i < chunk.item_ids.size(); ++i) {
            const auto size = i < chunk.item_sizes.size() ? chunk.item_sizes[i] : 0;
            out.append(QStringLiteral("  - ") + item_label(book, chunk.item_ids[i]) +
                       render_id_suffix(chunk.item_ids[i], options.includeIds) +
                       QStringLiteral("  ") + format_megabytes(size));
        }
    }

    for (const auto& violation : plan.violations()) {
        out.append(QStringLiteral("! %1 is %2 after compression, above the %3 limit")
                       .arg(item_label(book, violation.item_id))
                       .arg(format_megabytes(violation.verified_size_bytes))
                       .arg(format_megabytes(violation.effective_limit)));
    }

    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_plan_json(const BookSnapshot& book, const ChunkPlan& plan) {
    QJsonArray chunks;
    for (const auto& chunk : plan.chunks) {
        QJsonArray ids;
        for (const auto& id : chunk.item_ids) {
            ids.append(QString::fromStdString(id));
        }
        chunks.append(QJsonObject{
            {QStringLiteral("partNumber"), chunk.part_number},
            {QStringLiteral("title"), QString::fromStdString(chunk.title)},
            {QStringLiteral("itemIds"), ids},
            {QStringLiteral("estimatedSizeBytes"), static_cast<qint64>(chunk.estimated_size_bytes)},
            {QStringLiteral("verifiedSizeBytes"), static_cast<qint64>(chunk.verified_size_bytes)},
            {QStringLiteral("fingerprint"), QString::fromStdString(chunk.content_fingerprint)},
            {QStringLiteral("oversized"), chunk.oversized},
            {QStringLiteral("fullyOptimized"), chunk.fully_optimized},
        });
    }

    QJsonArray violations;
    for (const auto& violation : plan.violations()) {
        violations.append(QJsonObject{
            {QStringLiteral("partNumber"), violation.part_number},
            {QStringLiteral("itemId"), QString::fromStdString(violation.item_id)},
            {QStringLiteral("verifiedSizeBytes"), static_cast<qint64>(violation.verified_size_bytes)},
            {QStringLiteral("effectiveLimit"), static_cast<qint64>(violation.effective_limit)},
        });
    }

    const QJsonObject root{
        {QStringLiteral("title"), QString::fromStdString(book.title)},
        {QStringLiteral("effectiveLimit"), static_cast<qint64>(plan.effective_limit)},
        {QStringLiteral("compressionLevel"),
         QString::fromLatin1(to_string(book.settings.compression_level).data())},
        {QStringLiteral("chunks"), chunks},
        {QStringLiteral("violations"), violations},
    };
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_sync_records(const engine::SyncRecords& records) {
    QStringList out;
    for (const auto& [part, record] : records) {
        auto line = QStringLiteral("Part %1: %2").arg(part).arg(QString::fromLatin1(engine::to_string(record.status)));
        if (!record.remote_object_id.isEmpty()) {
            line += QStringLiteral(" -> ") + record.remote_object_id;
        }
        if (record.status == engine::SyncStatus::Dirty) {
            line += QStringLiteral(" (attempts %1) - %2")
                        .arg(record.attempts)
                        .arg(QString::fromStdString(record.last_error));
        }
        out.append(line);
    }
    if (out.isEmpty()) {
        return QString{};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace sheaf::cli
