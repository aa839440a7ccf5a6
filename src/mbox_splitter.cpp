// src/mbox_splitter.cpp
#include "mbox_splitter.hpp"
#include "hash_utility.hpp"
#include "ingest_config.hpp"
#include "ingest_errors.hpp"
#include "mail_date.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream> // For logging
#include <stdexcept>

namespace fs = std::filesystem;

namespace MailIngest
{
    namespace Split
    {

        namespace
        {
            bool startsWithNoCase(const std::string &line, const std::string &prefix)
            {
                if (line.size() < prefix.size())
                    return false;
                return std::equal(prefix.begin(), prefix.end(), line.begin(), [](char a, char b)
                                  { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
            }

            bool isBlankLine(const std::string &line)
            {
                return line.empty() || line == "\r";
            }

            // Accumulates whole messages into the chunk file currently being written.
            class ChunkWriter
            {
            public:
                ChunkWriter(fs::path output_dir, std::string base_name, std::string extension, size_t hash_buffer)
                    : output_dir(std::move(output_dir)), base_name(std::move(base_name)),
                      extension(std::move(extension)), hash_buffer(hash_buffer) {}

                ~ChunkWriter()
                {
                    // A chunk still open here was abandoned by an exception.
                    discardPartial();
                }

                bool isOpen() const { return out.is_open(); }
                uint64_t bytes() const { return chunk_bytes; }
                uint64_t messages() const { return chunk_messages; }

                void append(const std::string &message, bool counts_as_message, const std::optional<Mail::TimePoint> &date)
                {
                    if (!out.is_open())
                    {
                        open();
                    }
                    out.write(message.data(), static_cast<std::streamsize>(message.size()));
                    if (!out.good())
                    {
                        throw std::runtime_error("Failed to write data to chunk file: " + part_path.string());
                    }
                    chunk_bytes += message.size();
                    if (counts_as_message)
                    {
                        ++chunk_messages;
                    }
                    if (date)
                    {
                        range.include(*date);
                    }
                }

                // Close the current chunk, move it into place and describe it.
                Chunks::ChunkMetadata flush()
                {
                    out.flush();
                    if (!out.good())
                    {
                        throw std::runtime_error("Failed to flush chunk file: " + part_path.string());
                    }
                    out.close();

                    fs::rename(part_path, final_path);

                    Chunks::ChunkMetadata metadata;
                    metadata.chunk_id = chunk_id;
                    metadata.path = final_path.string();
                    metadata.size_bytes = fs::file_size(final_path);
                    metadata.message_count = chunk_messages;
                    metadata.date_range = range;
                    metadata.content_hash = Hashing::HashUtility::hashFile(final_path, hash_buffer);

                    std::cout << "[MboxSplitter] Chunk written: " << chunk_id << " (" << chunk_messages
                              << " messages, " << metadata.size_bytes / 1024 << " KB)" << std::endl;

                    chunk_bytes = 0;
                    chunk_messages = 0;
                    range = Chunks::DateRange{};
                    return metadata;
                }

                void discardPartial()
                {
                    if (out.is_open())
                    {
                        out.close();
                        std::error_code ec;
                        fs::remove(part_path, ec);
                    }
                }

            private:
                void open()
                {
                    ++ordinal;
                    chunk_id = Chunks::ChunkMetadata::makeChunkId(base_name, ordinal);
                    final_path = output_dir / (chunk_id + extension);
                    part_path = final_path;
                    part_path += ".part";
                    out.open(part_path, std::ios::binary | std::ios::trunc);
                    if (!out.is_open())
                    {
                        throw std::runtime_error("Failed to open file for writing chunk: " + part_path.string());
                    }
                }

                fs::path output_dir;
                std::string base_name;
                std::string extension;
                size_t hash_buffer;

                std::ofstream out;
                size_t ordinal = 0;
                std::string chunk_id;
                fs::path part_path;
                fs::path final_path;
                uint64_t chunk_bytes = 0;
                uint64_t chunk_messages = 0;
                Chunks::DateRange range;
            };
        } // namespace

        MboxSplitter::MboxSplitter(fs::path output_dir, size_t buffer_size)
            : output_dir(std::move(output_dir)), buffer_size(buffer_size == 0 ? 4096 : buffer_size)
        {
        }

        std::string MboxSplitter::archiveBaseName(const std::string &archive_path)
        {
            fs::path p(archive_path);
            return p.has_extension() ? p.stem().string() : p.filename().string();
        }

        Metadata::ArchiveManifest MboxSplitter::split(const std::string &archive_path,
                                                      size_t chunk_size_bytes,
                                                      const std::atomic<bool> *cancel) const
        {
            const auto start_time = std::chrono::steady_clock::now();
            fs::path archive(archive_path);
            if (!fs::exists(archive))
            {
                throw std::runtime_error("Archive file not found: " + archive_path);
            }
            Config::IngestConfig::ensureDirectoryExists(output_dir);

            std::cout << "[MboxSplitter] Splitting " << archive_path << " into chunks of "
                      << chunk_size_bytes << " bytes" << std::endl;

            Metadata::ArchiveManifest manifest;
            manifest.original_file = archive_path;
            manifest.original_size_bytes = fs::file_size(archive);
            manifest.original_hash = Hashing::HashUtility::hashFile(archive, buffer_size);

            const std::string base_name = archiveBaseName(archive_path);
            const std::string extension = archive.has_extension() ? archive.extension().string() : ".mbox";

            std::vector<char> read_buffer(buffer_size);
            std::ifstream in;
            in.rdbuf()->pubsetbuf(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
            in.open(archive, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Failed to open archive file: " + archive_path);
            }

            ChunkWriter writer(output_dir, base_name, extension, buffer_size);

            std::string message;           // Bytes of the message being accumulated
            bool message_has_delimiter = false;
            bool in_headers = false;
            std::optional<Mail::TimePoint> message_date;

            auto commitMessage = [&]()
            {
                if (message.empty())
                {
                    return;
                }
                if (chunk_size_bytes > 0 && writer.isOpen() && writer.messages() >= 1 &&
                    writer.bytes() + message.size() > chunk_size_bytes)
                {
                    manifest.chunks.push_back(writer.flush());
                }
                writer.append(message, message_has_delimiter, message_date);
                message.clear();
                message_date.reset();
            };

            std::string line;
            while (std::getline(in, line))
            {
                const bool had_newline = !in.eof();

                if (isDelimiterLine(line))
                {
                    if (cancel && cancel->load())
                    {
                        throw OperationCancelled("Split of " + archive_path + " cancelled");
                    }
                    // Bytes before the first delimiter stay with the first message.
                    if (message_has_delimiter)
                    {
                        commitMessage();
                    }
                    message_has_delimiter = true;
                    in_headers = true;
                    message_date.reset();
                }
                else if (in_headers)
                {
                    if (isBlankLine(line))
                    {
                        in_headers = false;
                    }
                    else if (!message_date && startsWithNoCase(line, "Date:"))
                    {
                        message_date = Mail::parseRfc2822Date(line.substr(5));
                        if (!message_date)
                        {
                            std::cerr << "[MboxSplitter] Warning: ignoring unparseable date header: "
                                      << line.substr(0, 80) << std::endl;
                        }
                    }
                }

                message += line;
                if (had_newline)
                {
                    message += '\n';
                }
            }
            if (in.bad())
            {
                throw std::runtime_error("I/O error while reading archive: " + archive_path);
            }

            commitMessage();
            if (writer.isOpen())
            {
                manifest.chunks.push_back(writer.flush());
            }

            manifest.split_timestamp = Mail::nowIso8601();
            manifest.save(Metadata::ArchiveManifest::sidecarPath(output_dir, base_name));

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cout << "[MboxSplitter] Split completed: " << manifest.chunks.size() << " chunks, "
                      << manifest.totalMessages() << " messages in " << elapsed.count() << " ms" << std::endl;
            return manifest;
        }

        bool MboxSplitter::validateSplit(const std::string &archive_path, const std::vector<std::string> &chunk_paths) const
        {
            std::cout << "[MboxSplitter] Validating split of " << archive_path << " (" << chunk_paths.size()
                      << " chunks)" << std::endl;
            try
            {
                const std::string original_hash = Hashing::HashUtility::hashFile(archive_path, buffer_size);

                Hashing::Sha256Stream combined;
                std::vector<char> buffer(buffer_size);
                for (const auto &chunk_path : chunk_paths)
                {
                    std::ifstream ifs(chunk_path, std::ios::binary);
                    if (!ifs.is_open())
                    {
                        throw std::runtime_error("Failed to open chunk file: " + chunk_path);
                    }
                    while (ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || ifs.gcount() > 0)
                    {
                        combined.update(buffer.data(), static_cast<size_t>(ifs.gcount()));
                    }
                    if (ifs.bad())
                    {
                        throw std::runtime_error("I/O error while reading chunk file: " + chunk_path);
                    }
                }
                const std::string reconstructed_hash = combined.hexDigest();

                const bool valid = original_hash == reconstructed_hash;
                if (!valid)
                {
                    std::cerr << "[MboxSplitter] Split validation failed: original " << original_hash
                              << " != reconstructed " << reconstructed_hash << std::endl;
                }
                return valid;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[MboxSplitter] Error validating split: " << e.what() << std::endl;
                return false;
            }
        }

        std::optional<Metadata::ArchiveManifest> MboxSplitter::loadManifest(const std::string &archive_base_name) const
        {
            fs::path sidecar = Metadata::ArchiveManifest::sidecarPath(output_dir, archive_base_name);
            if (!fs::exists(sidecar))
            {
                return std::nullopt;
            }
            return Metadata::ArchiveManifest::load(sidecar);
        }

    } // namespace Split
} // namespace MailIngest
