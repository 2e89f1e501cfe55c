#include "engine/fingerprint.hpp"

#include <QCryptographicHash>

namespace sheaf::engine {

namespace {

void add_field(QCryptographicHash& hash, const std::string& value) {
    // Length prefix keeps ("ab","c") and ("a","bc") apart.
    hash.addData(QByteArray::number(static_cast<qulonglong>(value.size())));
    hash.addData(QByteArrayView(":"));
    hash.addData(QByteArrayView(value.data(), static_cast<qsizetype>(value.size())));
    hash.addData(QByteArrayView(";"));
}

} // namespace

std::string content_fingerprint(const Chunk& chunk) {
    QCryptographicHash hash(QCryptographicHash::Sha256);
    add_field(hash, chunk.title);
    for (size_t i = 0; i < chunk.item_ids.size(); ++i) {
        add_field(hash, chunk.item_ids[i]);
        const int64_t size = i < chunk.item_sizes.size() ? chunk.item_sizes[i] : 0;
        add_field(hash, std::to_string(size));
    }
    return hash.result().toHex().toStdString();
}

ChunkPlan with_fingerprints(ChunkPlan plan) {
    for (auto& chunk : plan.chunks) {
        chunk.content_fingerprint = content_fingerprint(chunk);
    }
    return plan;
}

QString upload_filename(const std::string& chunk_title) {
    QString name = QString::fromStdString(chunk_title).trimmed();
    static const QString rejected = QStringLiteral("/\\:*?\"<>|");
    for (auto& ch : name) {
        if (rejected.contains(ch) || ch.unicode() < 0x20) {
            ch = QLatin1Char('_');
        }
    }
    if (name.isEmpty()) {
        name = QStringLiteral("Untitled");
    }
    return name + QStringLiteral(".pdf");
}

} // namespace sheaf::engine
