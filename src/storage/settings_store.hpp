#pragma once

#include "core/settings.hpp"

class QSettings;

namespace sheaf::storage {

/**
 * Read export settings, falling back to defaults for missing or unreadable
 * keys and clamping the rest into range.
 */
[[nodiscard]] Settings load_settings(QSettings& settings);
void save_settings(QSettings& settings, const Settings& value);

/**
 * Read engine loop timings; non-positive values fall back to defaults.
 */
[[nodiscard]] EngineTimings load_timings(QSettings& settings);
void save_timings(QSettings& settings, const EngineTimings& value);

} // namespace sheaf::storage
