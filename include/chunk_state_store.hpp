// include/chunk_state_store.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk.hpp"

struct sqlite3;

namespace MailIngest {
namespace State {

// A registered chunk and its processing state.
struct ChunkRecord {
    Chunks::ChunkMetadata metadata;
    std::string archive_path;
    Chunks::ChunkStatus status = Chunks::ChunkStatus::Pending;
    std::optional<uint64_t> resume_offset;
    std::string created_at;
    std::optional<std::string> processed_at;
    int64_t registration_seq = 0;
};

// Append-only audit record written with every status transition.
struct ProcessingLogEntry {
    int64_t id = 0;
    std::string chunk_id;
    Chunks::ChunkStatus status = Chunks::ChunkStatus::Pending; // Transition target
    std::optional<uint64_t> offset;
    std::optional<std::string> error;
    std::string timestamp;
};

struct ChunkStats {
    uint64_t total = 0;
    uint64_t pending = 0;
    uint64_t processing = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
};

// Durable chunk lifecycle store backed by SQLite.
//
//   pending --claim--> processing --complete--> completed
//                      processing --fail------> failed
//   completed|failed --reset--> pending
//
// Transitions are single conditional UPDATEs run in an IMMEDIATE transaction
// together with their log entry, so two workers (threads or processes) can
// never both claim the same chunk. A rejected transition returns false; a
// failed write throws std::runtime_error.
class ChunkStateStore {
public:
    explicit ChunkStateStore(const std::filesystem::path& db_path);
    ~ChunkStateStore();

    ChunkStateStore(const ChunkStateStore&) = delete;
    ChunkStateStore& operator=(const ChunkStateStore&) = delete;

    // Upsert by chunk_id. Re-registering resets status, offset and processed_at
    // but keeps the original registration order.
    void registerChunk(const Chunks::ChunkMetadata& chunk, const std::string& archive_path);
    void registerChunks(const std::vector<Chunks::ChunkMetadata>& chunks, const std::string& archive_path);

    bool claim(const std::string& chunk_id, uint64_t offset = 0);

    // Select the next pending chunk by order and claim it in one transaction.
    // An empty archive_path considers every archive.
    std::optional<ChunkRecord> claimNext(Chunks::WorkOrder order, const std::string& archive_path = "");

    // The chunk claimNext would pick, without claiming it.
    std::optional<ChunkRecord> nextPending(Chunks::WorkOrder order, const std::string& archive_path = "") const;

    bool recordProgress(const std::string& chunk_id, uint64_t offset);
    bool complete(const std::string& chunk_id);
    bool fail(const std::string& chunk_id, const std::string& error);
    bool reset(const std::string& chunk_id);

    bool setLabels(const std::string& chunk_id, const std::vector<std::string>& labels);

    std::optional<ChunkRecord> get(const std::string& chunk_id) const;
    std::vector<ChunkRecord> getByArchive(const std::string& archive_path) const;
    std::vector<ChunkRecord> getByStatus(Chunks::ChunkStatus status, const std::string& archive_path = "") const;
    std::vector<ProcessingLogEntry> getLog(const std::string& chunk_id) const;
    uint64_t getResumePoint(const std::string& chunk_id) const;
    ChunkStats getStats() const;

    // Administrative wipe of every chunk and log entry.
    void clearAll();

    const std::filesystem::path& path() const { return db_path; }

private:
    std::filesystem::path db_path;
    sqlite3* db = nullptr;
    mutable std::mutex mtx; // One connection, serialized

    void exec(const char* sql);
    void ensureSchema();
    void upsertChunk(const Chunks::ChunkMetadata& chunk, const std::string& archive_path);
    void appendLog(const std::string& chunk_id, Chunks::ChunkStatus status,
                   std::optional<uint64_t> offset, const std::optional<std::string>& error);
    std::optional<ChunkRecord> fetchChunk(const std::string& chunk_id) const;
    std::optional<std::string> selectNextPending(Chunks::WorkOrder order, const std::string& archive_path) const;

    // Runs update_sql (?1 = chunk_id, ?2 = int_param or text_param) and, if exactly
    // one row changed, appends a log entry in the same transaction.
    bool transition(const std::string& chunk_id, const char* update_sql,
                    std::optional<int64_t> int_param, const std::optional<std::string>& text_param,
                    Chunks::ChunkStatus target, std::optional<uint64_t> logged_offset,
                    const std::optional<std::string>& error);
};

} // namespace State
} // namespace MailIngest
