#pragma once

#include <QString>

namespace sheaf::cli {

// Installs a Qt message handler that appends lines of the form
//   2026-01-02T03:04:05.678Z I [sync] SYNC: part 2 saved as ...
// to a log file, rotating it to "<path>.1" once it passes a few megabytes.
// An empty path selects default_log_file_path(). Warnings and worse are also
// echoed to stderr.
void install_file_logging(const QString& path = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Path the installed handler writes to, empty before installation.
QString active_log_file_path();

} // namespace sheaf::cli
