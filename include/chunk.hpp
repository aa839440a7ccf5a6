// include/chunk.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mail_date.hpp"

namespace MailIngest {
namespace Chunks {

enum class ChunkStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

std::string toString(ChunkStatus status);
// Throws std::runtime_error for an unknown status name.
ChunkStatus statusFromString(const std::string& name);

// Work-selection policy for ChunkStateStore::claimNext.
enum class WorkOrder {
    Date, // earliest date_range.start first, chunks without dates last
    Size  // smallest size_bytes first
};

std::string toString(WorkOrder order);
WorkOrder workOrderFromString(const std::string& name);

struct DateRange {
    std::optional<Mail::TimePoint> start;
    std::optional<Mail::TimePoint> end;

    // Widen the range to include tp.
    void include(Mail::TimePoint tp);
};

// One contiguous slice of an archive as written by the splitter.
class ChunkMetadata {
public:
    std::string chunk_id;       // "{archiveBaseName}_chunk_{NNN}"
    std::string path;           // Where the chunk file lives
    uint64_t size_bytes = 0;
    uint64_t message_count = 0;
    DateRange date_range;
    std::string content_hash;   // SHA-256 of the chunk file
    std::vector<std::string> labels; // Filled in by downstream processing

    // Build the chunk id for the given 1-based ordinal.
    static std::string makeChunkId(const std::string& archive_base_name, size_t ordinal);

    nlohmann::json toJson() const;
    static ChunkMetadata fromJson(const nlohmann::json& j);
};

} // namespace Chunks
} // namespace MailIngest
