#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>

namespace sheaf {

constexpr int64_t MIB = 1024 * 1024;

// Range the archival service ceiling may be adjusted within.
constexpr int64_t MIN_CHUNK_SIZE_BYTES = 5 * MIB;
constexpr int64_t MAX_CHUNK_SIZE_BYTES = 50 * MIB;
constexpr int64_t DEFAULT_CHUNK_SIZE_BYTES = 15 * MIB;

constexpr double MAX_SAFETY_MARGIN_PERCENT = 20.0;
constexpr double DEFAULT_SAFETY_MARGIN_PERCENT = 1.0;

/**
 * Settings - Immutable snapshot consumed by one planning pass.
 *
 * Any change invalidates every plan computed from the previous snapshot.
 */
struct Settings {
    int64_t max_chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
    CompressionLevel compression_level = CompressionLevel::Low;
    double safety_margin_percent = DEFAULT_SAFETY_MARGIN_PERCENT;

    /**
     * Ceiling after the safety margin; every non-oversized chunk must verify
     * strictly below it.
     */
    [[nodiscard]] int64_t effective_limit() const noexcept {
        const double factor = 1.0 - (safety_margin_percent / 100.0);
        return static_cast<int64_t>(static_cast<double>(max_chunk_size_bytes) * factor);
    }

    bool operator==(const Settings&) const = default;
};

/**
 * EngineTimings - Scheduling cadence of the three engine loops, in ms.
 */
struct EngineTimings {
    int optimizer_tick_ms = 150;
    int plan_debounce_ms = 50;
    int sync_retry_ms = 1500;

    bool operator==(const EngineTimings&) const = default;
};

/**
 * Reject values outside the supported ranges.
 */
[[nodiscard]] Result<void, Error> validate_settings(const Settings& settings);

/**
 * Coerce out-of-range values to the nearest supported value.
 */
[[nodiscard]] Settings clamp_settings(Settings settings);

} // namespace sheaf
