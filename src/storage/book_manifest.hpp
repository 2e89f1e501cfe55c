#pragma once

#include "core/book.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QDir>
#include <QString>

namespace sheaf::storage {

/**
 * Parse a book manifest:
 *
 *   { "title": "...", "remoteFolderId": "...",
 *     "items": [ { "id", "name", "kind", "path", "size", "pageCount" } ] }
 *
 * "id", "kind" and "path" are required per item. Relative paths resolve
 * against `base`. A missing "size" is read from the file. Settings in the
 * returned snapshot are defaults; callers apply their own.
 */
[[nodiscard]] Result<BookSnapshot, Error> parse_manifest(const QByteArray& json, const QDir& base);

/**
 * Read and parse the manifest at `path`, resolving items against its directory.
 */
[[nodiscard]] Result<BookSnapshot, Error> load_manifest(const QString& path);

} // namespace sheaf::storage
