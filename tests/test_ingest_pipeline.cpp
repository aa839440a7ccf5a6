// tests/test_ingest_pipeline.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "ingest_pipeline.hpp"
#include "test_support.hpp"

using namespace MailIngest;
using namespace MailIngest::Testing;
using Chunks::ChunkStatus;

namespace {

// Messages with bodies of roughly body_kb kilobytes, so that MB-sized chunks hold a few each.
std::vector<MboxMessage> largeMessages(int n, size_t body_kb) {
    auto messages = numberedMessages(n);
    const std::string line(99, 'x');
    for (auto& m : messages) {
        m.body.clear();
        for (size_t i = 0; i < body_kb * 1024 / 100; ++i) {
            m.body += line + "\n";
        }
    }
    return messages;
}

class SubjectFilter : public MessageFilter {
public:
    explicit SubjectFilter(std::string drop) : drop(std::move(drop)) {}

    std::optional<Mail::ParsedMessage> process(Mail::ParsedMessage message) override {
        if (message.subject == drop) {
            return std::nullopt;
        }
        return message;
    }

private:
    std::string drop;
};

// Stalls on every message so that a chunk overruns a short time budget.
class SlowFilter : public MessageFilter {
public:
    explicit SlowFilter(std::chrono::milliseconds delay) : delay(delay) {}

    std::optional<Mail::ParsedMessage> process(Mail::ParsedMessage message) override {
        std::this_thread::sleep_for(delay);
        return message;
    }

private:
    std::chrono::milliseconds delay;
};

} // namespace

class IngestPipelineTest : public ::testing::Test {
protected:
    TempDir tmp;
    Config::IngestConfig config;
    std::unique_ptr<State::ChunkStateStore> store;

    void SetUp() override {
        config.chunk_output_dir = (tmp / "chunks").string();
        config.state_db_path = (tmp / "state.db").string();
        config.max_parallel_workers = 3;
        config.chunk_size_mb = 1;
        store = std::make_unique<State::ChunkStateStore>(config.state_db_path);
    }

    std::string writeArchive(const std::string& content) {
        auto path = tmp / "export.mbox";
        writeFile(path, content);
        return path.string();
    }
};

TEST_F(IngestPipelineTest, SplitsProcessesAndReconstructsThreads) {
    std::vector<MboxMessage> messages(4);
    messages[0].message_id = "<a@x>";
    messages[0].subject = "Deal";
    messages[0].thread_id = "777";
    messages[1].message_id = "<b@x>";
    messages[1].subject = "Re: Deal";
    messages[1].in_reply_to = "<a@x>";
    messages[1].date = "Tue, 2 Jan 2024 10:00:00 +0000";
    messages[2].message_id = "<c@x>";
    messages[2].subject = "Unrelated";
    messages[2].thread_id = "777";
    messages[2].date = "Wed, 3 Jan 2024 10:00:00 +0000";
    messages[3].message_id = "<d@x>";
    messages[3].subject = "Lunch";
    messages[3].date = "Thu, 4 Jan 2024 10:00:00 +0000";
    const std::string archive = writeArchive(renderMbox(messages));

    config.chunk_size_mb = 0;
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 1u);
    EXPECT_EQ(store->getStats().pending, 1u);

    Threads::ThreadReconstructor reconstructor;
    IngestSummary summary = pipeline.processArchive(archive, reconstructor);

    EXPECT_EQ(summary.processed, 4u);
    EXPECT_EQ(summary.errors, 0u);
    EXPECT_EQ(summary.chunks_completed, 1u);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(store->getStats().completed, 1u);

    auto threads = reconstructor.buildThreads();
    ASSERT_EQ(threads.size(), 2u);
    EXPECT_EQ(threads[0].thread_id, "777");
    EXPECT_EQ(threads[0].message_count, 3u);
    EXPECT_EQ(threads[1].rootMessage().message_id, "<d@x>");

    auto json = summary.toJson();
    EXPECT_EQ(json["processed"].get<uint64_t>(), 4u);
    EXPECT_EQ(json["chunks"][0]["status"].get<std::string>(), "completed");
}

TEST_F(IngestPipelineTest, ProcessesManyChunksWithSeveralWorkers) {
    const std::string archive = writeArchive(renderMbox(largeMessages(8, 600)));
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 8u);

    Threads::ThreadReconstructor reconstructor;
    IngestSummary summary = pipeline.processArchive(archive, reconstructor);

    EXPECT_EQ(summary.processed, 8u);
    EXPECT_EQ(summary.chunks.size(), 8u);
    EXPECT_EQ(summary.chunks_completed, 8u);
    EXPECT_EQ(reconstructor.messageCount(), 8u);
    EXPECT_EQ(summary.chunks.front().chunk_id, "export_chunk_001");

    for (const auto& record : store->getByArchive(IngestPipeline::archiveKey(archive))) {
        EXPECT_EQ(record.status, ChunkStatus::Completed);
        EXPECT_EQ(record.resume_offset.value_or(0), record.metadata.size_bytes);
    }

    // Nothing left to do on a second run.
    Threads::ThreadReconstructor again;
    EXPECT_EQ(pipeline.processArchive(archive, again).processed, 0u);
}

TEST_F(IngestPipelineTest, MalformedMessagesAreCountedNotFatal) {
    auto messages = numberedMessages(3);
    const std::string archive = writeArchive(renderMessage(messages[0]) + "From broken\nno header here\n\n" +
                                             renderMessage(messages[1]) + renderMessage(messages[2]));
    IngestPipeline pipeline(config, *store);
    pipeline.splitArchive(archive);

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.chunks_completed, 1u);
}

TEST_F(IngestPipelineTest, StrictModeFailsOnlyTheBrokenChunk) {
    auto messages = largeMessages(3, 600);
    const std::string archive = writeArchive(renderMessage(messages[0]) + renderMessage(messages[1]) +
                                             "From broken\nno header here\n\n" + renderMessage(messages[2]));
    config.skip_malformed = false;
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 3u);

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);

    EXPECT_EQ(summary.chunks_failed, 1u);
    EXPECT_EQ(summary.chunks_completed, 2u);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.chunks[1].status, ChunkStatus::Failed);
    ASSERT_TRUE(summary.chunks[1].error.has_value());

    auto failed = store->getByStatus(ChunkStatus::Failed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].metadata.chunk_id, "export_chunk_002");
    EXPECT_EQ(store->getLog("export_chunk_002").back().status, ChunkStatus::Failed);
}

TEST_F(IngestPipelineTest, FilterCanDropMessages) {
    auto messages = numberedMessages(4);
    messages[2].subject = "spam";
    const std::string archive = writeArchive(renderMbox(messages));
    IngestPipeline pipeline(config, *store);
    pipeline.splitArchive(archive);

    SubjectFilter filter("spam");
    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor, &filter);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(reconstructor.messageCount(), 3u);
}

TEST_F(IngestPipelineTest, AdoptsChunkInterruptedMidStream) {
    const std::string archive = writeArchive(renderMbox(largeMessages(6, 300)));
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 2u);
    ASSERT_EQ(manifest.chunks[0].message_count, 3u);

    // A previous session read the first message of chunk 1, then died.
    const std::string first_chunk = manifest.chunks[0].chunk_id;
    const std::string data = readFile(manifest.chunks[0].path);
    const uint64_t second_message = data.find("\nFrom ") + 1;
    ASSERT_TRUE(store->claim(first_chunk));
    ASSERT_TRUE(store->recordProgress(first_chunk, second_message));

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);

    EXPECT_EQ(summary.processed, 5u);
    EXPECT_EQ(summary.chunks_completed, 2u);
    EXPECT_EQ(summary.chunks[0].resumed_from, second_message);
    EXPECT_EQ(store->get(first_chunk)->status, ChunkStatus::Completed);
}

TEST_F(IngestPipelineTest, LeavesInterruptedChunksAloneWithoutResume) {
    const std::string archive = writeArchive(renderMbox(largeMessages(6, 300)));
    config.resume_on_failure = false;
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_TRUE(store->claim(manifest.chunks[0].chunk_id));

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(store->get(manifest.chunks[0].chunk_id)->status, ChunkStatus::Processing);
}

TEST_F(IngestPipelineTest, RetriesFailedChunks) {
    const std::string archive = writeArchive(renderMbox(numberedMessages(3)));
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    const std::string chunk_id = manifest.chunks[0].chunk_id;
    ASSERT_TRUE(store->claim(chunk_id));
    ASSERT_TRUE(store->fail(chunk_id, "earlier crash"));

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(store->get(chunk_id)->status, ChunkStatus::Completed);
}

TEST_F(IngestPipelineTest, CancelledRunClaimsNothing) {
    const std::string archive = writeArchive(renderMbox(numberedMessages(3)));
    IngestPipeline pipeline(config, *store);
    pipeline.splitArchive(archive);
    pipeline.cancel();

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(store->getStats().pending, 1u);
}

TEST_F(IngestPipelineTest, ChunkOverItsTimeBudgetFailsWithTimeout) {
    const std::string archive = writeArchive(renderMbox(numberedMessages(3)));
    config.chunk_size_mb = 0;
    config.io_timeout_seconds = 1;
    config.max_parallel_workers = 1;
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 1u);
    const std::string chunk_id = manifest.chunks[0].chunk_id;

    SlowFilter slow(std::chrono::milliseconds(1200));
    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor, &slow);

    EXPECT_EQ(summary.chunks_failed, 1u);
    EXPECT_EQ(summary.processed, 1u);
    ASSERT_EQ(summary.chunks.size(), 1u);
    EXPECT_EQ(summary.chunks[0].error.value_or(""), "timeout");

    auto record = store->get(chunk_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, ChunkStatus::Failed);

    // The checkpoint taken before the overrun survives the failure.
    const std::string data = readFile(manifest.chunks[0].path);
    const uint64_t second_message = data.find("\nFrom ") + 1;
    EXPECT_EQ(record->resume_offset.value_or(0), second_message);
    EXPECT_EQ(store->getResumePoint(chunk_id), second_message);

    auto log = store->getLog(chunk_id);
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log.back().status, ChunkStatus::Failed);
    EXPECT_EQ(log.back().error.value_or(""), "timeout");
}

TEST_F(IngestPipelineTest, CheckpointsEveryNthMessage) {
    const std::string archive = writeArchive(renderMbox(numberedMessages(5)));
    config.chunk_size_mb = 0;
    config.checkpoint_every_messages = 2;
    IngestPipeline pipeline(config, *store);
    auto manifest = pipeline.splitArchive(archive);
    ASSERT_EQ(manifest.chunks.size(), 1u);
    const std::string chunk_id = manifest.chunks[0].chunk_id;

    // Offsets of the 3rd and 5th "From " lines: the positions after messages 2 and 4.
    const std::string data = readFile(manifest.chunks[0].path);
    std::vector<uint64_t> starts;
    for (size_t pos = data.find("\nFrom "); pos != std::string::npos; pos = data.find("\nFrom ", pos + 1)) {
        starts.push_back(pos + 1);
    }
    ASSERT_EQ(starts.size(), 4u);

    Threads::ThreadReconstructor reconstructor;
    auto summary = pipeline.processArchive(archive, reconstructor);
    EXPECT_EQ(summary.processed, 5u);

    std::vector<uint64_t> progress;
    for (const auto& entry : store->getLog(chunk_id)) {
        if (entry.status == ChunkStatus::Processing && entry.offset && *entry.offset > 0) {
            progress.push_back(*entry.offset);
        }
    }
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_EQ(progress[0], starts[1]);
    EXPECT_EQ(progress[1], starts[3]);
    EXPECT_EQ(store->get(chunk_id)->status, ChunkStatus::Completed);
}

TEST_F(IngestPipelineTest, ProcessingAnUnsplitArchiveThrows) {
    const std::string archive = writeArchive(renderMbox(numberedMessages(1)));
    IngestPipeline pipeline(config, *store);
    Threads::ThreadReconstructor reconstructor;
    EXPECT_THROW(pipeline.processArchive(archive, reconstructor), std::runtime_error);
}
