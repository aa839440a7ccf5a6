// include/message_stream_reader.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "parsed_message.hpp"

namespace MailIngest
{
    namespace Mail
    {

        struct ReaderOptions
        {
            uint64_t resume_offset = 0;   // Lines starting before this byte are skipped
            size_t buffer_size = 4 * 1024;
            bool skip_malformed = true;   // false: rethrow MessageParseError
            const std::atomic<bool> *cancel = nullptr;
        };

        struct ReaderState
        {
            uint64_t position = 0; // Byte offset where the next message begins
            uint64_t messages_processed = 0;
            uint64_t bytes_read = 0;
            uint64_t errors = 0;
            uint64_t skipped_bytes = 0; // Before the resume offset, or outside any message
        };

        // Pull-based reader over one mbox chunk. Each call to next() reads one
        // message block from disk and parses it. Not restartable: construct a new
        // reader with resume_offset = position() to continue later.
        class MessageStreamReader
        {
        public:
            // Throws std::runtime_error if the file cannot be opened.
            explicit MessageStreamReader(const std::string &chunk_path, ReaderOptions options = ReaderOptions());

            MessageStreamReader(const MessageStreamReader &) = delete;
            MessageStreamReader &operator=(const MessageStreamReader &) = delete;

            // The next parsed message, or std::nullopt at end of file.
            // Throws OperationCancelled when the cancel flag is set, and
            // MessageParseError for a malformed block when skip_malformed is off.
            std::optional<ParsedMessage> next();

            const ReaderState &state() const { return st; }
            uint64_t position() const { return st.position; }
            uint64_t fileSize() const { return file_size; }
            // bytes_read / fileSize in [0, 1]; 1 for an empty file.
            double progress() const;

            const std::string &path() const { return chunk_path; }

        private:
            bool readLine(std::string &line, uint64_t &line_start);
            bool readBlock(std::string &block);
            void discard(const std::string &line, const char *reason);

            std::string chunk_path;
            ReaderOptions options;
            std::vector<char> read_buffer;
            std::ifstream in;
            uint64_t file_size = 0;
            uint64_t offset = 0; // Start of the next unread line

            std::optional<std::string> lookahead; // Delimiter line opening the next block
            uint64_t lookahead_start = 0;
            bool warned_discard = false;

            ReaderState st;
        };

    } // namespace Mail
} // namespace MailIngest
