// src/archive_manifest.cpp
#include "archive_manifest.hpp"
#include <fstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace MailIngest
{
    namespace Metadata
    {

        nlohmann::json ArchiveManifest::toJson() const
        {
            nlohmann::json chunk_array = nlohmann::json::array();
            for (const auto &chunk : chunks)
            {
                chunk_array.push_back(chunk.toJson());
            }
            return nlohmann::json{
                {"originalFile", original_file},
                {"originalSizeBytes", original_size_bytes},
                {"originalHash", original_hash},
                {"chunks", chunk_array},
                {"splitTimestamp", split_timestamp}};
        }

        ArchiveManifest ArchiveManifest::fromJson(const nlohmann::json &j)
        {
            ArchiveManifest manifest;
            j.at("originalFile").get_to(manifest.original_file);
            j.at("originalSizeBytes").get_to(manifest.original_size_bytes);
            j.at("originalHash").get_to(manifest.original_hash);
            j.at("splitTimestamp").get_to(manifest.split_timestamp);
            for (const auto &chunk : j.at("chunks"))
            {
                manifest.chunks.push_back(Chunks::ChunkMetadata::fromJson(chunk));
            }
            return manifest;
        }

        uint64_t ArchiveManifest::totalMessages() const
        {
            uint64_t total = 0;
            for (const auto &chunk : chunks)
            {
                total += chunk.message_count;
            }
            return total;
        }

        std::vector<std::string> ArchiveManifest::chunkPaths() const
        {
            std::vector<std::string> paths;
            paths.reserve(chunks.size());
            for (const auto &chunk : chunks)
            {
                paths.push_back(chunk.path);
            }
            return paths;
        }

        void ArchiveManifest::save(const fs::path &path) const
        {
            fs::path temp_path = path;
            temp_path += ".tmp";

            {
                std::ofstream ofs(temp_path);
                if (!ofs.is_open())
                {
                    throw std::runtime_error("Failed to open file for writing manifest: " + temp_path.string());
                }
                ofs << toJson().dump(2);
                ofs.flush();
                if (!ofs.good())
                {
                    throw std::runtime_error("Failed to write all data to manifest file: " + temp_path.string());
                }
            }

            std::error_code ec;
            fs::rename(temp_path, path, ec);
            if (ec)
            {
                fs::remove(temp_path, ec);
                throw std::runtime_error("Failed to move manifest into place: " + path.string());
            }
        }

        ArchiveManifest ArchiveManifest::load(const fs::path &path)
        {
            if (!fs::exists(path))
            {
                throw std::runtime_error("Manifest file not found: " + path.string());
            }

            std::ifstream ifs(path);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open manifest file for reading: " + path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
                return fromJson(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Error parsing manifest file " + path.string() + ": " + e.what());
            }
        }

        fs::path ArchiveManifest::sidecarPath(const fs::path &output_dir, const std::string &archive_base_name)
        {
            return output_dir / (archive_base_name + "_metadata.json");
        }

    } // namespace Metadata
} // namespace MailIngest
