// tests/test_mbox_splitter.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <sstream>

#include "hash_utility.hpp"
#include "ingest_errors.hpp"
#include "mbox_splitter.hpp"
#include "test_support.hpp"

using namespace MailIngest;
using namespace MailIngest::Testing;
namespace fs = std::filesystem;

class MboxSplitterTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path out_dir = tmp / "chunks";

    fs::path writeArchive(const std::string& content, const std::string& name = "archive.mbox") {
        fs::path p = tmp / name;
        writeFile(p, content);
        return p;
    }

    std::string concatenate(const Metadata::ArchiveManifest& manifest) {
        std::string all;
        for (const auto& chunk : manifest.chunks) {
            all += readFile(chunk.path);
        }
        return all;
    }
};

TEST_F(MboxSplitterTest, ChunksConcatenateToTheOriginalArchive) {
    const std::string content = renderMbox(numberedMessages(20));
    fs::path archive = writeArchive(content);

    Split::MboxSplitter splitter(out_dir, 128);
    auto manifest = splitter.split(archive.string(), 600);

    EXPECT_GT(manifest.chunks.size(), 1u);
    EXPECT_EQ(concatenate(manifest), content);
    EXPECT_EQ(manifest.original_size_bytes, content.size());
    EXPECT_EQ(manifest.original_hash, Hashing::HashUtility::generateSHA256(content));
    EXPECT_EQ(manifest.totalMessages(), 20u);
    EXPECT_TRUE(splitter.validateSplit(archive.string(), manifest.chunkPaths()));
}

TEST_F(MboxSplitterTest, NeverSplitsAMessage) {
    fs::path archive = writeArchive(renderMbox(numberedMessages(12)));
    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 500);

    for (const auto& chunk : manifest.chunks) {
        std::string data = readFile(chunk.path);
        EXPECT_EQ(data.compare(0, 5, "From "), 0) << chunk.chunk_id;

        // Count delimiter lines: must match the recorded message count.
        std::istringstream lines(data);
        std::string line;
        uint64_t delimiters = 0;
        while (std::getline(lines, line)) {
            if (Split::MboxSplitter::isDelimiterLine(line)) ++delimiters;
        }
        EXPECT_EQ(delimiters, chunk.message_count);
        EXPECT_GE(chunk.message_count, 1u);
        EXPECT_EQ(chunk.size_bytes, data.size());
        EXPECT_EQ(chunk.content_hash, Hashing::HashUtility::generateSHA256(data));
        if (chunk.message_count > 1) {
            EXPECT_LE(chunk.size_bytes, 500u);
        }
    }
}

TEST_F(MboxSplitterTest, ZeroChunkSizeKeepsEverythingInOneChunk) {
    std::vector<MboxMessage> messages(3);
    messages[0].message_id = "<a@test>";
    messages[0].date = "Mon, 1 Jan 2024 10:00:00 +0000";
    messages[1].message_id = "<b@test>";
    messages[1].date = "Wed, 10 Jan 2024 10:00:00 +0000";
    messages[2].message_id = "<c@test>";
    messages[2].date = "Thu, 1 Feb 2024 10:00:00 +0000";
    fs::path archive = writeArchive(renderMbox(messages));

    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 0);

    ASSERT_EQ(manifest.chunks.size(), 1u);
    const auto& chunk = manifest.chunks[0];
    EXPECT_EQ(chunk.message_count, 3u);
    EXPECT_EQ(chunk.chunk_id, "archive_chunk_001");
    EXPECT_EQ(fs::path(chunk.path).filename().string(), "archive_chunk_001.mbox");
    ASSERT_TRUE(chunk.date_range.start && chunk.date_range.end);
    EXPECT_EQ(Mail::formatIso8601(*chunk.date_range.start), "2024-01-01T10:00:00Z");
    EXPECT_EQ(Mail::formatIso8601(*chunk.date_range.end), "2024-02-01T10:00:00Z");
    EXPECT_TRUE(chunk.labels.empty());
}

TEST_F(MboxSplitterTest, OversizedMessageGetsItsOwnChunk) {
    fs::path archive = writeArchive(renderMbox(numberedMessages(4)));
    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 10);

    ASSERT_EQ(manifest.chunks.size(), 4u);
    for (const auto& chunk : manifest.chunks) {
        EXPECT_EQ(chunk.message_count, 1u);
        EXPECT_GT(chunk.size_bytes, 10u);
    }
    EXPECT_EQ(manifest.chunks[3].chunk_id, "archive_chunk_004");
}

TEST_F(MboxSplitterTest, KeepsPreambleAndUnterminatedLastLine) {
    std::string content = "stray preamble line\n" + renderMbox(numberedMessages(3));
    content += "From x@y Mon Jan  1 10:00:00 2024\nSubject: last\n\nno trailing newline";
    fs::path archive = writeArchive(content);

    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 300);

    EXPECT_EQ(concatenate(manifest), content);
    EXPECT_EQ(readFile(manifest.chunks.front().path).rfind("stray preamble line\n", 0), 0u);
    EXPECT_EQ(manifest.totalMessages(), 4u);
}

TEST_F(MboxSplitterTest, UnparseableDatesOnlyAffectDateRange) {
    std::vector<MboxMessage> messages(2);
    messages[0].message_id = "<a@test>";
    messages[0].date = "sometime last week";
    messages[1].message_id = "<b@test>";
    messages[1].date = "";
    fs::path archive = writeArchive(renderMbox(messages));

    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 0);
    ASSERT_EQ(manifest.chunks.size(), 1u);
    EXPECT_EQ(manifest.chunks[0].message_count, 2u);
    EXPECT_FALSE(manifest.chunks[0].date_range.start.has_value());
}

TEST_F(MboxSplitterTest, WritesAndReloadsManifestSidecar) {
    fs::path archive = writeArchive(renderMbox(numberedMessages(5)));
    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 300);

    EXPECT_TRUE(fs::exists(out_dir / "archive_metadata.json"));
    auto loaded = splitter.loadManifest("archive");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->original_hash, manifest.original_hash);
    EXPECT_EQ(loaded->chunks.size(), manifest.chunks.size());
    EXPECT_EQ(loaded->chunks[0].content_hash, manifest.chunks[0].content_hash);
    EXPECT_EQ(loaded->split_timestamp, manifest.split_timestamp);

    EXPECT_FALSE(splitter.loadManifest("other").has_value());
}

TEST_F(MboxSplitterTest, ValidateDetectsTamperedChunk) {
    fs::path archive = writeArchive(renderMbox(numberedMessages(6)));
    Split::MboxSplitter splitter(out_dir);
    auto manifest = splitter.split(archive.string(), 300);
    ASSERT_GE(manifest.chunks.size(), 2u);

    writeFile(manifest.chunks[1].path, readFile(manifest.chunks[1].path) + "X");
    EXPECT_FALSE(splitter.validateSplit(archive.string(), manifest.chunkPaths()));

    auto paths = manifest.chunkPaths();
    paths.pop_back();
    EXPECT_FALSE(splitter.validateSplit(archive.string(), paths));
    EXPECT_FALSE(splitter.validateSplit(archive.string(), {(tmp / "missing.mbox").string()}));
}

TEST_F(MboxSplitterTest, MissingArchiveThrows) {
    Split::MboxSplitter splitter(out_dir);
    EXPECT_THROW(splitter.split((tmp / "nope.mbox").string(), 100), std::runtime_error);
}

TEST_F(MboxSplitterTest, CancelledSplitLeavesNoManifestOrPartialChunk) {
    fs::path archive = writeArchive(renderMbox(numberedMessages(5)));
    Split::MboxSplitter splitter(out_dir);
    std::atomic<bool> cancel{true};

    EXPECT_THROW(splitter.split(archive.string(), 300, &cancel), OperationCancelled);
    EXPECT_FALSE(fs::exists(out_dir / "archive_metadata.json"));
    for (const auto& entry : fs::directory_iterator(out_dir)) {
        EXPECT_NE(entry.path().extension().string(), ".part");
    }
}

TEST(MboxSplitterNamingTest, BaseNameDropsExtension) {
    EXPECT_EQ(Split::MboxSplitter::archiveBaseName("/data/mail/export.mbox"), "export");
    EXPECT_EQ(Split::MboxSplitter::archiveBaseName("inbox"), "inbox");
    EXPECT_TRUE(Split::MboxSplitter::isDelimiterLine("From a@b Mon Jan 1"));
    EXPECT_FALSE(Split::MboxSplitter::isDelimiterLine("From: a@b"));
    EXPECT_FALSE(Split::MboxSplitter::isDelimiterLine(">From a@b"));
}
