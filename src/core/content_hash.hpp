// File: src/core/content_hash.hpp
#pragma once

#include <string>

namespace engram {

/// Compute the content hash of a record: lowercase hex SHA-256 of the bytes
///
/// This is the only place a content hash is produced. Ingest, integrity
/// checks, and the store's (owner, hash) uniqueness key all go through it.
///
/// @param content Record content
/// @return 64-character hex digest
/// @throws std::runtime_error if the digest cannot be computed
std::string ComputeContentHash(const std::string& content);

} // namespace engram
