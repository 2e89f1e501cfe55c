#include <catch2/catch_test_macros.hpp>
#include "core/settings.hpp"
#include "core/types.hpp"
#include "storage/settings_store.hpp"

#include <QSettings>
#include <QTemporaryDir>
#include <limits>

using namespace sheaf;

TEST_CASE("Settings: defaults match the export defaults", "[settings]") {
    const Settings settings;
    REQUIRE(settings.max_chunk_size_bytes == 15 * MIB);
    REQUIRE(settings.compression_level == CompressionLevel::Low);
    REQUIRE(settings.safety_margin_percent == 1.0);
    REQUIRE(validate_settings(settings).is_ok());
}

TEST_CASE("Settings: effective limit applies the safety margin", "[settings]") {
    Settings settings;
    settings.max_chunk_size_bytes = 10 * MIB;

    settings.safety_margin_percent = 0.0;
    REQUIRE(settings.effective_limit() == 10 * MIB);

    settings.safety_margin_percent = 10.0;
    REQUIRE(settings.effective_limit() == 9 * MIB);

    settings.safety_margin_percent = 20.0;
    REQUIRE(settings.effective_limit() == 8 * MIB);
}

TEST_CASE("Settings: validation rejects out-of-range values", "[settings]") {
    Settings settings;

    SECTION("Chunk size below the minimum") {
        settings.max_chunk_size_bytes = 4 * MIB;
        auto result = validate_settings(settings);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidInput);
    }

    SECTION("Chunk size above the maximum") {
        settings.max_chunk_size_bytes = 51 * MIB;
        REQUIRE(validate_settings(settings).is_err());
    }

    SECTION("Negative margin") {
        settings.safety_margin_percent = -1.0;
        REQUIRE(validate_settings(settings).is_err());
    }

    SECTION("Margin above twenty percent") {
        settings.safety_margin_percent = 20.5;
        REQUIRE(validate_settings(settings).is_err());
    }

    SECTION("NaN margin") {
        settings.safety_margin_percent = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(validate_settings(settings).is_err());
    }
}

TEST_CASE("Settings: clamp coerces into range", "[settings]") {
    Settings settings;
    settings.max_chunk_size_bytes = 1;
    settings.safety_margin_percent = 90.0;

    const auto clamped = clamp_settings(settings);
    REQUIRE(clamped.max_chunk_size_bytes == MIN_CHUNK_SIZE_BYTES);
    REQUIRE(clamped.safety_margin_percent == MAX_SAFETY_MARGIN_PERCENT);
    REQUIRE(validate_settings(clamped).is_ok());

    settings.max_chunk_size_bytes = 500 * MIB;
    settings.safety_margin_percent = std::numeric_limits<double>::infinity();
    const auto clamped_high = clamp_settings(settings);
    REQUIRE(clamped_high.max_chunk_size_bytes == MAX_CHUNK_SIZE_BYTES);
    REQUIRE(clamped_high.safety_margin_percent == DEFAULT_SAFETY_MARGIN_PERCENT);
}

TEST_CASE("Types: names round-trip through the parsers", "[settings]") {
    for (auto level : {CompressionLevel::Low, CompressionLevel::Medium, CompressionLevel::High}) {
        REQUIRE(parse_compression_level(to_string(level)) == level);
    }
    for (auto kind : {ItemKind::Image, ItemKind::Pdf, ItemKind::Document}) {
        REQUIRE(parse_item_kind(to_string(kind)) == kind);
    }
    REQUIRE_FALSE(parse_compression_level("extreme").has_value());
    REQUIRE_FALSE(parse_item_kind("video").has_value());
    REQUIRE(is_multi_page(ItemKind::Pdf));
    REQUIRE_FALSE(is_multi_page(ItemKind::Image));
}

TEST_CASE("SettingsStore: export settings persist through QSettings", "[settings][storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings stored(dir.filePath(QStringLiteral("sheaf.ini")), QSettings::IniFormat);

    SECTION("Missing keys load as defaults") {
        REQUIRE(storage::load_settings(stored) == Settings{});
    }

    SECTION("Saved values load back") {
        Settings settings;
        settings.max_chunk_size_bytes = 25 * MIB;
        settings.compression_level = CompressionLevel::High;
        settings.safety_margin_percent = 5.0;
        storage::save_settings(stored, settings);

        REQUIRE(stored.value(QStringLiteral("export/compression_level")).toString() == QStringLiteral("high"));
        REQUIRE(storage::load_settings(stored) == settings);
    }

    SECTION("Unreadable values fall back or clamp") {
        stored.setValue(QStringLiteral("export/compression_level"), QStringLiteral("extreme"));
        stored.setValue(QStringLiteral("export/max_chunk_size_bytes"), 999LL * MIB);
        stored.setValue(QStringLiteral("export/safety_margin_percent"), 50.0);

        const auto loaded = storage::load_settings(stored);
        REQUIRE(loaded.compression_level == CompressionLevel::Low);
        REQUIRE(loaded.max_chunk_size_bytes == MAX_CHUNK_SIZE_BYTES);
        REQUIRE(loaded.safety_margin_percent == MAX_SAFETY_MARGIN_PERCENT);
    }
}

TEST_CASE("SettingsStore: engine timings persist and reject non-positive values", "[settings][storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings stored(dir.filePath(QStringLiteral("sheaf.ini")), QSettings::IniFormat);

    REQUIRE(storage::load_timings(stored) == EngineTimings{});

    storage::save_timings(stored, EngineTimings{.optimizer_tick_ms = 10, .plan_debounce_ms = 20, .sync_retry_ms = 30});
    const auto loaded = storage::load_timings(stored);
    REQUIRE(loaded.optimizer_tick_ms == 10);
    REQUIRE(loaded.plan_debounce_ms == 20);
    REQUIRE(loaded.sync_retry_ms == 30);

    stored.setValue(QStringLiteral("engine/sync_retry_ms"), 0);
    REQUIRE(storage::load_timings(stored).sync_retry_ms == EngineTimings{}.sync_retry_ms);
}
