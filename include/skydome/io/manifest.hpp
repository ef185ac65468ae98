#pragma once

#include "skydome/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace skydome::io {

struct Manifest {
    std::vector<PhotoRecord> records;  // ascending index
    std::string sha256;                // of the manifest file, empty when parsed from memory
};

/**
 * Parse a manifest: a JSON array of objects with required keys
 * index, timestamp, alpha, beta, gamma, photoUri.
 * Missing or mistyped fields throw InputMissingError; malformed JSON throws
 * DecodeError; duplicate indices throw ValidationError.
 */
std::vector<PhotoRecord> parse_manifest(const nlohmann::json& doc);

Manifest load_manifest(const fs::path& path);


// photos_dir / basename(photo_uri); photoUri may be a device URI or path.
fs::path resolve_photo_path(const fs::path& photos_dir, const PhotoRecord& record);

} // namespace skydome::io
