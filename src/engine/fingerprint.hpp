#pragma once

#include "core/chunk.hpp"
#include <QString>
#include <string>

namespace sheaf::engine {

/**
 * Hex SHA-256 over the chunk's title, ordered item ids and planned item sizes.
 *
 * Two chunks with the same fingerprint produce the same bundle, so the sync
 * engine skips uploading one whose fingerprint it already pushed.
 */
[[nodiscard]] std::string content_fingerprint(const Chunk& chunk);

/**
 * Stamp every chunk of `plan` with its fingerprint.
 */
[[nodiscard]] ChunkPlan with_fingerprints(ChunkPlan plan);

/**
 * Deterministic remote filename for a chunk title: path separators and
 * characters rejected by common filesystems become '_', then ".pdf".
 */
[[nodiscard]] QString upload_filename(const std::string& chunk_title);

} // namespace sheaf::engine
