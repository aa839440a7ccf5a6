// include/archive_manifest.hpp
#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

#include <nlohmann/json.hpp> // For JSON handling
#include "chunk.hpp"

namespace MailIngest {
namespace Metadata {

// Sidecar describing how one archive was split: "{archiveBaseName}_metadata.json".
class ArchiveManifest {
public:
    std::string original_file;
    uint64_t original_size_bytes = 0;
    std::string original_hash;                 // SHA-256 of the whole archive
    std::vector<Chunks::ChunkMetadata> chunks; // In archive order
    std::string split_timestamp;               // ISO 8601 (e.g., "YYYY-MM-DDTHH:MM:SSZ")

    ArchiveManifest() = default;

    nlohmann::json toJson() const;
    static ArchiveManifest fromJson(const nlohmann::json& j);

    uint64_t totalMessages() const;
    std::vector<std::string> chunkPaths() const;

    // Write the manifest to path atomically (temp file + rename).
    void save(const std::filesystem::path& path) const;

    static ArchiveManifest load(const std::filesystem::path& path);

    // Sidecar location for an archive base name inside output_dir.
    static std::filesystem::path sidecarPath(const std::filesystem::path& output_dir, const std::string& archive_base_name);
};

} // namespace Metadata
} // namespace MailIngest
