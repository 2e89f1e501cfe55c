#include "storage/settings_store.hpp"

#include <QDebug>
#include <QSettings>

namespace sheaf::storage {

namespace {
constexpr const char* kMaxChunkSize = "export/max_chunk_size_bytes";
constexpr const char* kCompressionLevel = "export/compression_level";
constexpr const char* kSafetyMargin = "export/safety_margin_percent";
constexpr const char* kOptimizerTick = "engine/optimizer_tick_ms";
constexpr const char* kPlanDebounce = "engine/plan_debounce_ms";
constexpr const char* kSyncRetry = "engine/sync_retry_ms";

int positive_or(QSettings& settings, const char* key, int fallback) {
    bool ok = false;
    const int value = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    return ok && value > 0 ? value : fallback;
}
} // namespace

Settings load_settings(QSettings& settings) {
    Settings out;

    bool ok = false;
    const auto max_bytes = settings.value(QString::fromLatin1(kMaxChunkSize),
                                          QVariant::fromValue<qlonglong>(out.max_chunk_size_bytes))
                               .toLongLong(&ok);
    if (ok) {
        out.max_chunk_size_bytes = max_bytes;
    }

    const auto level_text = settings.value(QString::fromLatin1(kCompressionLevel)).toString();
    if (!level_text.isEmpty()) {
        if (auto level = parse_compression_level(level_text.toStdString())) {
            out.compression_level = *level;
        } else {
            qWarning() << "SETTINGS: unknown compression level" << level_text << ", using low";
        }
    }

    const auto margin = settings.value(QString::fromLatin1(kSafetyMargin), out.safety_margin_percent)
                            .toDouble(&ok);
    if (ok) {
        out.safety_margin_percent = margin;
    }

    const auto clamped = clamp_settings(out);
    if (!(clamped == out)) {
        qWarning() << "SETTINGS: stored export settings out of range, clamped";
    }
    return clamped;
}

void save_settings(QSettings& settings, const Settings& value) {
    settings.setValue(QString::fromLatin1(kMaxChunkSize),
                      QVariant::fromValue<qlonglong>(value.max_chunk_size_bytes));
    settings.setValue(QString::fromLatin1(kCompressionLevel),
                      QString::fromLatin1(to_string(value.compression_level).data()));
    settings.setValue(QString::fromLatin1(kSafetyMargin), value.safety_margin_percent);
}

EngineTimings load_timings(QSettings& settings) {
    const EngineTimings defaults;
    return EngineTimings{
        .optimizer_tick_ms = positive_or(settings, kOptimizerTick, defaults.optimizer_tick_ms),
        .plan_debounce_ms = positive_or(settings, kPlanDebounce, defaults.plan_debounce_ms),
        .sync_retry_ms = positive_or(settings, kSyncRetry, defaults.sync_retry_ms),
    };
}

void save_timings(QSettings& settings, const EngineTimings& value) {
    settings.setValue(QString::fromLatin1(kOptimizerTick), value.optimizer_tick_ms);
    settings.setValue(QString::fromLatin1(kPlanDebounce), value.plan_debounce_ms);
    settings.setValue(QString::fromLatin1(kSyncRetry), value.sync_retry_ms);
}

} // namespace sheaf::storage
