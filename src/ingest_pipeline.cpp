// src/ingest_pipeline.cpp
#include "ingest_pipeline.hpp"
#include "ingest_errors.hpp"
#include "message_stream_reader.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream> // For logging
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace MailIngest
{

    nlohmann::json ChunkSummary::toJson() const
    {
        nlohmann::json j;
        j["chunkId"] = chunk_id;
        j["status"] = Chunks::toString(status);
        j["processed"] = processed;
        j["skipped"] = skipped;
        j["errors"] = errors;
        j["bytesRead"] = bytes_read;
        j["resumedFrom"] = resumed_from;
        j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
        return j;
    }

    void IngestSummary::add(const ChunkSummary &chunk)
    {
        processed += chunk.processed;
        skipped += chunk.skipped;
        errors += chunk.errors;
        if (chunk.status == Chunks::ChunkStatus::Completed)
            ++chunks_completed;
        else if (chunk.status == Chunks::ChunkStatus::Failed)
            ++chunks_failed;
        chunks.push_back(chunk);
    }

    nlohmann::json IngestSummary::toJson() const
    {
        nlohmann::json j;
        j["archive"] = archive_path;
        j["processed"] = processed;
        j["skipped"] = skipped;
        j["errors"] = errors;
        j["chunksCompleted"] = chunks_completed;
        j["chunksFailed"] = chunks_failed;
        j["cancelled"] = cancelled;
        j["chunks"] = nlohmann::json::array();
        for (const auto &chunk : chunks)
        {
            j["chunks"].push_back(chunk.toJson());
        }
        return j;
    }

    IngestPipeline::IngestPipeline(Config::IngestConfig config, State::ChunkStateStore &store)
        : cfg(std::move(config)), store(store),
          splitter(cfg.getOutputDirPath(), std::max<size_t>(cfg.bufferSizeBytes(), 64 * 1024))
    {
        std::cout << "[IngestPipeline] Initialized (workers=" << cfg.max_parallel_workers
                  << ", order=" << Chunks::toString(cfg.work_order) << ")" << std::endl;
    }

    std::string IngestPipeline::archiveKey(const std::string &archive_path)
    {
        return fs::absolute(archive_path).lexically_normal().string();
    }

    Metadata::ArchiveManifest IngestPipeline::splitArchive(const std::string &archive_path)
    {
        const std::string key = archiveKey(archive_path);
        Metadata::ArchiveManifest manifest = splitter.split(key, cfg.chunkSizeBytes(), &cancel_requested);

        if (!splitter.validateSplit(key, manifest.chunkPaths()))
        {
            throw std::runtime_error("Split integrity check failed for " + key);
        }

        store.registerChunks(manifest.chunks, key);
        return manifest;
    }

    std::vector<State::ChunkRecord> IngestPipeline::recoverInterrupted(const std::string &archive_key)
    {
        std::vector<State::ChunkRecord> stale = store.getByStatus(Chunks::ChunkStatus::Processing, archive_key);
        if (!cfg.resume_on_failure)
        {
            if (!stale.empty())
            {
                std::cerr << "[IngestPipeline] Warning: " << stale.size()
                          << " chunks left in processing; reset them to retry" << std::endl;
            }
            return {};
        }

        for (const auto &chunk : stale)
        {
            std::cerr << "[IngestPipeline] Warning: adopting interrupted chunk " << chunk.metadata.chunk_id
                      << " at byte " << chunk.resume_offset.value_or(0) << std::endl;
        }
        for (const auto &chunk : store.getByStatus(Chunks::ChunkStatus::Failed, archive_key))
        {
            if (store.reset(chunk.metadata.chunk_id))
            {
                std::cout << "[IngestPipeline] Retrying failed chunk " << chunk.metadata.chunk_id << std::endl;
            }
        }
        return stale;
    }

    IngestSummary IngestPipeline::processArchive(const std::string &archive_path,
                                                 Threads::ThreadReconstructor &threads,
                                                 MessageFilter *filter)
    {
        const std::string key = archiveKey(archive_path);
        if (store.getByArchive(key).empty())
        {
            throw std::runtime_error("No chunks registered for " + key + "; split it first");
        }

        IngestSummary summary;
        summary.archive_path = key;
        std::vector<State::ChunkRecord> adopted = recoverInterrupted(key);

        std::vector<std::future<std::vector<ChunkSummary>>> results;
        {
            Concurrency::ThreadPool pool(cfg.max_parallel_workers);

            for (const auto &chunk : adopted)
            {
                results.push_back(pool.enqueue([this, chunk, &threads, filter]()
                                               { return std::vector<ChunkSummary>{processChunk(chunk, threads, filter)}; }));
            }

            for (size_t i = 0; i < cfg.max_parallel_workers; ++i)
            {
                results.push_back(pool.enqueue([this, &key, &threads, filter]()
                                               {
                                                   std::vector<ChunkSummary> done;
                                                   while (!cancel_requested)
                                                   {
                                                       auto chunk = store.claimNext(cfg.work_order, key);
                                                       if (!chunk)
                                                           break;
                                                       done.push_back(processChunk(*chunk, threads, filter));
                                                   }
                                                   return done; }));
            }
        } // Pool drains and joins here

        for (auto &result : results)
        {
            for (const auto &chunk : result.get())
            {
                summary.add(chunk);
            }
        }
        std::sort(summary.chunks.begin(), summary.chunks.end(), [](const ChunkSummary &a, const ChunkSummary &b)
                  { return a.chunk_id < b.chunk_id; });
        summary.cancelled = cancel_requested.load();

        std::cout << "[IngestPipeline] " << key << ": " << summary.processed << " processed, " << summary.skipped
                  << " skipped, " << summary.errors << " errors, " << summary.chunks_failed << " chunks failed"
                  << std::endl;
        return summary;
    }

    ChunkSummary IngestPipeline::processChunk(const State::ChunkRecord &chunk,
                                              Threads::ThreadReconstructor &threads,
                                              MessageFilter *filter)
    {
        const std::string &chunk_id = chunk.metadata.chunk_id;
        ChunkSummary summary;
        summary.chunk_id = chunk_id;
        summary.status = Chunks::ChunkStatus::Processing;
        summary.resumed_from = store.getResumePoint(chunk_id);

        Mail::ReaderOptions options;
        options.resume_offset = summary.resumed_from;
        options.buffer_size = cfg.bufferSizeBytes();
        options.skip_malformed = cfg.skip_malformed;
        options.cancel = &cancel_requested;

        const auto started = std::chrono::steady_clock::now();
        const auto budget = std::chrono::seconds(cfg.io_timeout_seconds);

        std::unique_ptr<Mail::MessageStreamReader> reader;
        auto collectCounters = [&]()
        {
            if (reader)
            {
                summary.errors = reader->state().errors;
                summary.bytes_read = reader->state().bytes_read;
            }
        };

        try
        {
            reader = std::make_unique<Mail::MessageStreamReader>(chunk.metadata.path, options);
            size_t since_checkpoint = 0;

            while (auto message = reader->next())
            {
                std::optional<Mail::ParsedMessage> kept =
                    filter ? filter->process(std::move(*message)) : std::move(message);
                if (kept)
                {
                    threads.add(std::move(*kept));
                    ++summary.processed;
                }
                else
                {
                    ++summary.skipped;
                }

                if (++since_checkpoint >= cfg.checkpoint_every_messages)
                {
                    store.recordProgress(chunk_id, reader->position());
                    since_checkpoint = 0;
                }
                if (cfg.io_timeout_seconds > 0 && std::chrono::steady_clock::now() - started > budget)
                {
                    throw std::runtime_error("timeout");
                }
            }

            collectCounters();
            if (store.complete(chunk_id))
            {
                summary.status = Chunks::ChunkStatus::Completed;
            }
            else
            {
                summary.error = "chunk was no longer in processing";
                std::cerr << "[IngestPipeline] Warning: could not complete " << chunk_id << std::endl;
            }
        }
        catch (const OperationCancelled &e)
        {
            collectCounters();
            summary.error = "cancelled";
            std::cerr << "[IngestPipeline] " << e.what() << "; " << chunk_id << " left in processing" << std::endl;
        }
        catch (const std::exception &e)
        {
            collectCounters();
            summary.error = e.what();
            if (store.fail(chunk_id, e.what()))
            {
                summary.status = Chunks::ChunkStatus::Failed;
            }
        }
        return summary;
    }

} // namespace MailIngest
