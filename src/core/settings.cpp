#include "core/settings.hpp"

#include <algorithm>
#include <cmath>

namespace sheaf {

Result<void, Error> validate_settings(const Settings& settings) {
    if (settings.max_chunk_size_bytes < MIN_CHUNK_SIZE_BYTES ||
        settings.max_chunk_size_bytes > MAX_CHUNK_SIZE_BYTES) {
        return Result<void, Error>::err(Error{
            "max chunk size must be between " + std::to_string(MIN_CHUNK_SIZE_BYTES) +
                " and " + std::to_string(MAX_CHUNK_SIZE_BYTES) + " bytes",
            ErrorKind::InvalidInput});
    }
    if (!std::isfinite(settings.safety_margin_percent) ||
        settings.safety_margin_percent < 0.0 ||
        settings.safety_margin_percent > MAX_SAFETY_MARGIN_PERCENT) {
        return Result<void, Error>::err(Error{
            "safety margin must be between 0 and 20 percent", ErrorKind::InvalidInput});
    }
    return Result<void, Error>::ok();
}

Settings clamp_settings(Settings settings) {
    settings.max_chunk_size_bytes = std::clamp(settings.max_chunk_size_bytes,
                                               MIN_CHUNK_SIZE_BYTES,
                                               MAX_CHUNK_SIZE_BYTES);
    if (!std::isfinite(settings.safety_margin_percent)) {
        settings.safety_margin_percent = DEFAULT_SAFETY_MARGIN_PERCENT;
    }
    settings.safety_margin_percent = std::clamp(settings.safety_margin_percent,
                                                0.0,
                                                MAX_SAFETY_MARGIN_PERCENT);
    return settings;
}

} // namespace sheaf
