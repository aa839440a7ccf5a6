// src/chunk.cpp
#include "chunk.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace MailIngest
{
    namespace Chunks
    {

        std::string toString(ChunkStatus status)
        {
            switch (status)
            {
            case ChunkStatus::Pending:
                return "pending";
            case ChunkStatus::Processing:
                return "processing";
            case ChunkStatus::Completed:
                return "completed";
            case ChunkStatus::Failed:
                return "failed";
            }
            return "pending";
        }

        ChunkStatus statusFromString(const std::string &name)
        {
            if (name == "pending")
                return ChunkStatus::Pending;
            if (name == "processing")
                return ChunkStatus::Processing;
            if (name == "completed")
                return ChunkStatus::Completed;
            if (name == "failed")
                return ChunkStatus::Failed;
            throw std::runtime_error("Unknown chunk status: " + name);
        }

        std::string toString(WorkOrder order)
        {
            return order == WorkOrder::Size ? "size" : "date";
        }

        WorkOrder workOrderFromString(const std::string &name)
        {
            if (name == "date")
                return WorkOrder::Date;
            if (name == "size")
                return WorkOrder::Size;
            throw std::runtime_error("Unknown work order '" + name + "', expected 'date' or 'size'");
        }

        void DateRange::include(Mail::TimePoint tp)
        {
            if (!start || tp < *start)
                start = tp;
            if (!end || tp > *end)
                end = tp;
        }

        std::string ChunkMetadata::makeChunkId(const std::string &archive_base_name, size_t ordinal)
        {
            std::stringstream ss;
            ss << archive_base_name << "_chunk_" << std::setw(3) << std::setfill('0') << ordinal;
            return ss.str();
        }

        namespace
        {
            nlohmann::json optionalTime(const std::optional<Mail::TimePoint> &tp)
            {
                if (!tp)
                    return nullptr;
                return Mail::formatIso8601(*tp);
            }

            std::optional<Mail::TimePoint> readOptionalTime(const nlohmann::json &j)
            {
                if (j.is_null())
                    return std::nullopt;
                auto tp = Mail::parseIso8601(j.get<std::string>());
                if (!tp)
                    throw std::runtime_error("Invalid timestamp in chunk metadata: " + j.get<std::string>());
                return tp;
            }
        } // namespace

        // Helpers for nlohmann/json serialization
        void to_json(nlohmann::json &j, const ChunkMetadata &c)
        {
            j = nlohmann::json{
                {"chunkId", c.chunk_id},
                {"path", c.path},
                {"sizeBytes", c.size_bytes},
                {"messageCount", c.message_count},
                {"dateRange", {{"start", optionalTime(c.date_range.start)}, {"end", optionalTime(c.date_range.end)}}},
                {"contentHash", c.content_hash},
                {"labels", c.labels}};
        }

        void from_json(const nlohmann::json &j, ChunkMetadata &c)
        {
            j.at("chunkId").get_to(c.chunk_id);
            j.at("path").get_to(c.path);
            j.at("sizeBytes").get_to(c.size_bytes);
            j.at("messageCount").get_to(c.message_count);
            const auto &range = j.at("dateRange");
            c.date_range.start = readOptionalTime(range.at("start"));
            c.date_range.end = readOptionalTime(range.at("end"));
            j.at("contentHash").get_to(c.content_hash);
            c.labels = j.value("labels", std::vector<std::string>{});
        }

        nlohmann::json ChunkMetadata::toJson() const
        {
            return *this; // Uses the to_json helper function
        }

        ChunkMetadata ChunkMetadata::fromJson(const nlohmann::json &j)
        {
            ChunkMetadata metadata;
            j.get_to(metadata);
            return metadata;
        }

    } // namespace Chunks
} // namespace MailIngest
