// include/mbox_splitter.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "archive_manifest.hpp"

namespace MailIngest
{
    namespace Split
    {

        // Splits an mbox archive into size-bounded chunk files without ever
        // cutting a message in two. Concatenating the chunks in order
        // reproduces the archive byte for byte.
        class MboxSplitter
        {
        public:
            explicit MboxSplitter(std::filesystem::path output_dir, size_t buffer_size = 64 * 1024);

            // Streams archive_path and writes "{base}_chunk_NNN.{ext}" files plus the
            // "{base}_metadata.json" sidecar into the output directory. A message is
            // never split; a chunk is flushed before a message that would push it past
            // chunk_size_bytes, as long as the chunk already holds one message.
            // A chunk_size_bytes of 0 means no limit (one chunk).
            // Throws std::runtime_error on I/O failure and OperationCancelled if
            // *cancel becomes true; neither leaves a manifest behind.
            Metadata::ArchiveManifest split(const std::string &archive_path,
                                            size_t chunk_size_bytes,
                                            const std::atomic<bool> *cancel = nullptr) const;

            // Hash the chunks concatenated in order and compare with the archive hash.
            // Advisory: mismatches and unreadable files are reported as false.
            bool validateSplit(const std::string &archive_path, const std::vector<std::string> &chunk_paths) const;

            // Read back a sidecar written by split(), if present.
            std::optional<Metadata::ArchiveManifest> loadManifest(const std::string &archive_base_name) const;

            const std::filesystem::path &outputDir() const { return output_dir; }

            // "mail/archive.mbox" -> "archive"
            static std::string archiveBaseName(const std::string &archive_path);

            // An mbox message starts at a line beginning with "From ".
            static bool isDelimiterLine(const std::string &line)
            {
                return line.compare(0, 5, "From ") == 0;
            }

        private:
            std::filesystem::path output_dir;
            size_t buffer_size;
        };

    } // namespace Split
} // namespace MailIngest
