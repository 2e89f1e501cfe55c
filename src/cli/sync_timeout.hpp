#pragma once

#include "core/result.hpp"
#include <QString>
#include <chrono>

namespace sheaf::cli {

// Longest wait 'sync' accepts: one day.
constexpr std::chrono::seconds MAX_SYNC_TIMEOUT{24 * 60 * 60};

/**
 * Parse the --timeout value: a whole number of seconds in [1, MAX_SYNC_TIMEOUT].
 */
[[nodiscard]] Result<std::chrono::seconds, Error> parse_sync_timeout(const QString& text);

} // namespace sheaf::cli
