#include "cli/sync_timeout.hpp"

namespace sheaf::cli {

Result<std::chrono::seconds, Error> parse_sync_timeout(const QString& text) {
    bool ok = false;
    const qlonglong value = text.trimmed().toLongLong(&ok);
    if (!ok || value <= 0 || value > MAX_SYNC_TIMEOUT.count()) {
        return Result<std::chrono::seconds, Error>::err(Error{
            QStringLiteral("--timeout expects a whole number of seconds between 1 and %1")
                .arg(MAX_SYNC_TIMEOUT.count())
                .toStdString(),
            ErrorKind::InvalidInput});
    }
    return Result<std::chrono::seconds, Error>::ok(std::chrono::seconds(value));
}

} // namespace sheaf::cli
