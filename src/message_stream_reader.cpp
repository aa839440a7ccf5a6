// src/message_stream_reader.cpp
#include "message_stream_reader.hpp"
#include "ingest_errors.hpp"
#include "mbox_splitter.hpp"
#include "mime_parser.hpp"

#include <filesystem>
#include <iostream> // For logging
#include <stdexcept>

namespace fs = std::filesystem;

namespace MailIngest
{
    namespace Mail
    {

        MessageStreamReader::MessageStreamReader(const std::string &chunk_path, ReaderOptions options)
            : chunk_path(chunk_path), options(options),
              read_buffer(options.buffer_size == 0 ? 4096 : options.buffer_size)
        {
            in.rdbuf()->pubsetbuf(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
            in.open(chunk_path, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Failed to open chunk file: " + chunk_path);
            }
            file_size = fs::file_size(chunk_path);
            if (options.resume_offset > 0)
            {
                std::cout << "[MessageStreamReader] Resuming " << chunk_path << " at byte "
                          << options.resume_offset << std::endl;
            }
        }

        double MessageStreamReader::progress() const
        {
            if (file_size == 0)
            {
                return 1.0;
            }
            return static_cast<double>(st.bytes_read) / static_cast<double>(file_size);
        }

        bool MessageStreamReader::readLine(std::string &line, uint64_t &line_start)
        {
            if (!std::getline(in, line))
            {
                if (in.bad())
                {
                    throw std::runtime_error("I/O error while reading chunk file: " + chunk_path);
                }
                return false;
            }
            if (!in.eof())
            {
                line += '\n';
            }
            line_start = offset;
            offset += line.size();
            st.bytes_read = offset;
            return true;
        }

        void MessageStreamReader::discard(const std::string &line, const char *reason)
        {
            st.skipped_bytes += line.size();
            if (!warned_discard)
            {
                std::cerr << "[MessageStreamReader] Warning: discarding " << reason << " in " << chunk_path
                          << " at byte " << (offset - line.size()) << std::endl;
                warned_discard = true;
            }
        }

        bool MessageStreamReader::readBlock(std::string &block)
        {
            std::string line;
            uint64_t line_start = 0;

            // Find the delimiter that opens the block.
            while (!lookahead)
            {
                if (!readLine(line, line_start))
                {
                    st.position = offset;
                    return false;
                }
                if (line_start < options.resume_offset)
                {
                    st.skipped_bytes += line.size();
                    continue;
                }
                if (Split::MboxSplitter::isDelimiterLine(line))
                {
                    lookahead = std::move(line);
                    lookahead_start = line_start;
                }
                else
                {
                    discard(line, options.resume_offset > 0 ? "partial message after resume point"
                                                            : "bytes before the first message");
                }
            }

            block = std::move(*lookahead);
            lookahead.reset();

            while (readLine(line, line_start))
            {
                if (Split::MboxSplitter::isDelimiterLine(line))
                {
                    lookahead = std::move(line);
                    lookahead_start = line_start;
                    break;
                }
                block += line;
            }
            st.position = lookahead ? lookahead_start : offset;
            return true;
        }

        std::optional<ParsedMessage> MessageStreamReader::next()
        {
            for (;;)
            {
                if (options.cancel && options.cancel->load())
                {
                    throw OperationCancelled("Read of " + chunk_path + " cancelled at byte " +
                                             std::to_string(st.position));
                }

                std::string block;
                if (!readBlock(block))
                {
                    return std::nullopt;
                }

                // Drop the "From " envelope line.
                size_t newline = block.find('\n');
                std::string raw = newline == std::string::npos ? std::string() : block.substr(newline + 1);

                try
                {
                    ParsedMessage message = MimeParser::parseMessage(raw);
                    ++st.messages_processed;
                    return message;
                }
                catch (const MessageParseError &e)
                {
                    ++st.errors;
                    if (!options.skip_malformed)
                    {
                        throw;
                    }
                    std::cerr << "[MessageStreamReader] Warning: skipping malformed message ending at byte "
                              << st.position << " in " << chunk_path << ": " << e.what() << std::endl;
                }
            }
        }

    } // namespace Mail
} // namespace MailIngest
