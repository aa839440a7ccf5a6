// include/ingest_pipeline.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive_manifest.hpp"
#include "chunk_state_store.hpp"
#include "ingest_config.hpp"
#include "mbox_splitter.hpp"
#include "parsed_message.hpp"
#include "thread_reconstructor.hpp"

namespace MailIngest
{

    // Hook for downstream stages (label filtering, text extraction) that see
    // every message before it reaches the thread reconstructor. Returning
    // std::nullopt drops the message. Called from worker threads.
    class MessageFilter
    {
    public:
        virtual ~MessageFilter() = default;
        virtual std::optional<Mail::ParsedMessage> process(Mail::ParsedMessage message) = 0;
    };

    struct ChunkSummary
    {
        std::string chunk_id;
        Chunks::ChunkStatus status = Chunks::ChunkStatus::Pending;
        uint64_t processed = 0; // Handed to the reconstructor
        uint64_t skipped = 0;   // Dropped by the filter
        uint64_t errors = 0;    // Malformed blocks
        uint64_t bytes_read = 0;
        uint64_t resumed_from = 0;
        std::optional<std::string> error;

        nlohmann::json toJson() const;
    };

    struct IngestSummary
    {
        std::string archive_path;
        std::vector<ChunkSummary> chunks;
        uint64_t processed = 0;
        uint64_t skipped = 0;
        uint64_t errors = 0;
        uint64_t chunks_completed = 0;
        uint64_t chunks_failed = 0;
        bool cancelled = false;

        void add(const ChunkSummary &chunk);
        nlohmann::json toJson() const;
    };

    // The split -> register -> claim -> read -> reconstruct loop over one archive.
    class IngestPipeline
    {
    public:
        IngestPipeline(Config::IngestConfig config, State::ChunkStateStore &store);

        // Split, verify the chunks against the archive hash and register them.
        // Throws std::runtime_error on I/O failure or an integrity mismatch.
        Metadata::ArchiveManifest splitArchive(const std::string &archive_path);

        // Process every pending chunk of a split archive with up to
        // max_parallel_workers workers, feeding messages into threads.
        // A failing chunk is marked failed; the others continue.
        IngestSummary processArchive(const std::string &archive_path,
                                     Threads::ThreadReconstructor &threads,
                                     MessageFilter *filter = nullptr);

        // Stop between messages. Chunks in flight stay "processing".
        void cancel() { cancel_requested = true; }
        bool cancelled() const { return cancel_requested.load(); }

        const Config::IngestConfig &config() const { return cfg; }

        // Key under which an archive's chunks are registered (absolute, normalized path).
        static std::string archiveKey(const std::string &archive_path);

    private:
        ChunkSummary processChunk(const State::ChunkRecord &chunk,
                                  Threads::ThreadReconstructor &threads,
                                  MessageFilter *filter);

        // Chunks a previous session left behind: "processing" ones are returned
        // for adoption, "failed" ones are reset to pending.
        std::vector<State::ChunkRecord> recoverInterrupted(const std::string &archive_key);

        Config::IngestConfig cfg;
        State::ChunkStateStore &store;
        Split::MboxSplitter splitter;
        std::atomic<bool> cancel_requested{false};
    };

} // namespace MailIngest
