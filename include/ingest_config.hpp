// include/ingest_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

#include "chunk.hpp"

namespace MailIngest
{
    namespace Config
    {

        class IngestConfig
        {
        public:
            // Target chunk size; a single message larger than this still gets its own chunk.
            // 0 disables size-based splitting.
            size_t chunk_size_mb = 500;
            std::string chunk_output_dir = "./data/chunks";
            std::string state_db_path = "./data/chunk_index.db";
            size_t max_parallel_workers = 4;
            bool resume_on_failure = true;

            // Read-buffer granularity for streaming I/O
            size_t buffer_size_kb = 4;
            // Wall-clock budget for one chunk; 0 disables the check.
            size_t io_timeout_seconds = 30;

            Chunks::WorkOrder work_order = Chunks::WorkOrder::Date;
            int subject_match_window_days = 7;
            bool skip_malformed = true;
            bool use_transport_thread_id = true;
            // Record a resume checkpoint every N messages.
            size_t checkpoint_every_messages = 1;

            size_t chunkSizeBytes() const { return chunk_size_mb * 1024 * 1024; }
            size_t bufferSizeBytes() const { return buffer_size_kb * 1024; }

            // Overlay the keys present in j onto the current values.
            void merge(const nlohmann::json &j);

            // Apply CHUNK_SIZE_MB, CHUNK_OUTPUT_DIR, ... from the environment.
            void applyEnvironment();

            // Throws std::runtime_error when a value is out of range.
            void validate() const;

            nlohmann::json toJson() const;

            // Defaults, then the JSON file (if given), then the environment.
            static IngestConfig load(const std::string &config_file = "");

            // Get the absolute path for the chunk output directory.
            // This will create the directory if it doesn't exist
            std::filesystem::path getOutputDirPath() const;

            // Helper to ensure directories exist
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace MailIngest
