// src/ingest_config.cpp
#include "ingest_config.hpp"
#include <climits>   // For INT_MAX
#include <cstdlib>   // For std::getenv
#include <fstream>
#include <iostream>  // For logging
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace MailIngest
{
    namespace Config
    {

        namespace
        {
            size_t parseSize(const std::string &name, const std::string &value, long long max_value = LLONG_MAX)
            {
                try
                {
                    size_t used = 0;
                    long long parsed = std::stoll(value, &used);
                    if (used != value.size() || parsed < 0 || parsed > max_value)
                    {
                        throw std::invalid_argument(value);
                    }
                    return static_cast<size_t>(parsed);
                }
                catch (const std::exception &)
                {
                    throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
                }
            }

            bool parseBool(const std::string &name, const std::string &value)
            {
                if (value == "1" || value == "true" || value == "yes")
                    return true;
                if (value == "0" || value == "false" || value == "no")
                    return false;
                throw std::runtime_error("Invalid boolean for " + name + ": '" + value + "'");
            }

            // Non-negative integer key; anything else (negative, fractional, text) is rejected.
            long long readCount(const nlohmann::json &j, const char *key, long long current, long long max_value = LLONG_MAX)
            {
                if (!j.contains(key))
                {
                    return current;
                }
                const nlohmann::json &value = j.at(key);
                if (!value.is_number_integer())
                {
                    throw std::runtime_error(std::string("Invalid ingestion config: ") + key + " must be an integer");
                }
                if (value.is_number_unsigned())
                {
                    if (value.get<unsigned long long>() > static_cast<unsigned long long>(max_value))
                    {
                        throw std::runtime_error(std::string("Invalid ingestion config: ") + key + " is out of range");
                    }
                    return static_cast<long long>(value.get<unsigned long long>());
                }
                long long parsed = value.get<long long>();
                if (parsed < 0 || parsed > max_value)
                {
                    throw std::runtime_error(std::string("Invalid ingestion config: ") + key + " is out of range");
                }
                return parsed;
            }

            const char *env(const char *name)
            {
                const char *value = std::getenv(name);
                return (value && *value) ? value : nullptr;
            }
        } // namespace

        void IngestConfig::merge(const nlohmann::json &j)
        {
            try
            {
                chunk_size_mb = static_cast<size_t>(readCount(j, "chunk_size_mb", chunk_size_mb));
                chunk_output_dir = j.value("chunk_output_dir", chunk_output_dir);
                state_db_path = j.value("state_db_path", state_db_path);
                max_parallel_workers = static_cast<size_t>(readCount(j, "max_parallel_workers", max_parallel_workers));
                resume_on_failure = j.value("resume_on_failure", resume_on_failure);
                buffer_size_kb = static_cast<size_t>(readCount(j, "buffer_size_kb", buffer_size_kb));
                io_timeout_seconds = static_cast<size_t>(readCount(j, "io_timeout_seconds", io_timeout_seconds));
                if (j.contains("work_order"))
                {
                    work_order = Chunks::workOrderFromString(j.at("work_order").get<std::string>());
                }
                subject_match_window_days =
                    static_cast<int>(readCount(j, "subject_match_window_days", subject_match_window_days, INT_MAX));
                skip_malformed = j.value("skip_malformed", skip_malformed);
                use_transport_thread_id = j.value("use_transport_thread_id", use_transport_thread_id);
                checkpoint_every_messages =
                    static_cast<size_t>(readCount(j, "checkpoint_every_messages", checkpoint_every_messages));
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error(std::string("Invalid ingestion config: ") + e.what());
            }
        }

        void IngestConfig::applyEnvironment()
        {
            if (const char *v = env("CHUNK_SIZE_MB"))
                chunk_size_mb = parseSize("CHUNK_SIZE_MB", v);
            if (const char *v = env("CHUNK_OUTPUT_DIR"))
                chunk_output_dir = v;
            if (const char *v = env("CHUNK_STATE_DB"))
                state_db_path = v;
            if (const char *v = env("MAX_PARALLEL_WORKERS"))
                max_parallel_workers = parseSize("MAX_PARALLEL_WORKERS", v);
            if (const char *v = env("RESUME_ON_FAILURE"))
                resume_on_failure = parseBool("RESUME_ON_FAILURE", v);
            if (const char *v = env("BUFFER_SIZE_KB"))
                buffer_size_kb = parseSize("BUFFER_SIZE_KB", v);
            if (const char *v = env("IO_TIMEOUT_SECONDS"))
                io_timeout_seconds = parseSize("IO_TIMEOUT_SECONDS", v);
            if (const char *v = env("WORK_ORDER"))
                work_order = Chunks::workOrderFromString(v);
            if (const char *v = env("SUBJECT_WINDOW_DAYS"))
                subject_match_window_days = static_cast<int>(parseSize("SUBJECT_WINDOW_DAYS", v, INT_MAX));
            if (const char *v = env("SKIP_MALFORMED"))
                skip_malformed = parseBool("SKIP_MALFORMED", v);
            if (const char *v = env("USE_TRANSPORT_THREAD_ID"))
                use_transport_thread_id = parseBool("USE_TRANSPORT_THREAD_ID", v);
            if (const char *v = env("CHECKPOINT_EVERY"))
                checkpoint_every_messages = parseSize("CHECKPOINT_EVERY", v);
        }

        void IngestConfig::validate() const
        {
            if (max_parallel_workers == 0)
            {
                throw std::runtime_error("max_parallel_workers must be at least 1");
            }
            if (buffer_size_kb == 0)
            {
                throw std::runtime_error("buffer_size_kb must be at least 1");
            }
            if (checkpoint_every_messages == 0)
            {
                throw std::runtime_error("checkpoint_every_messages must be at least 1");
            }
            if (subject_match_window_days < 0)
            {
                throw std::runtime_error("subject_match_window_days must not be negative");
            }
            if (chunk_output_dir.empty() || state_db_path.empty())
            {
                throw std::runtime_error("chunk_output_dir and state_db_path must be set");
            }
        }

        nlohmann::json IngestConfig::toJson() const
        {
            return nlohmann::json{
                {"chunk_size_mb", chunk_size_mb},
                {"chunk_output_dir", chunk_output_dir},
                {"state_db_path", state_db_path},
                {"max_parallel_workers", max_parallel_workers},
                {"resume_on_failure", resume_on_failure},
                {"buffer_size_kb", buffer_size_kb},
                {"io_timeout_seconds", io_timeout_seconds},
                {"work_order", Chunks::toString(work_order)},
                {"subject_match_window_days", subject_match_window_days},
                {"skip_malformed", skip_malformed},
                {"use_transport_thread_id", use_transport_thread_id},
                {"checkpoint_every_messages", checkpoint_every_messages}};
        }

        IngestConfig IngestConfig::load(const std::string &config_file)
        {
            IngestConfig config;
            if (!config_file.empty())
            {
                std::ifstream ifs(config_file);
                if (!ifs.is_open())
                {
                    throw std::runtime_error("Failed to open config file: " + config_file);
                }
                nlohmann::json j;
                try
                {
                    ifs >> j;
                }
                catch (const nlohmann::json::parse_error &e)
                {
                    throw std::runtime_error("Error parsing config file " + config_file + ": " + e.what());
                }
                config.merge(j);
            }
            config.applyEnvironment();
            config.validate();
            return config;
        }

        fs::path IngestConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        std::cout << "[IngestConfig] Created directory: " << dir_path << std::endl;
                    }
                    else
                    {
                        // Another process may have created it in the meantime.
                        if (!fs::exists(dir_path))
                        {
                            throw std::runtime_error("Failed to create directory: " + dir_path.string());
                        }
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return fs::absolute(dir_path);
        }

        fs::path IngestConfig::getOutputDirPath() const
        {
            return ensureDirectoryExists(chunk_output_dir);
        }

    } // namespace Config
} // namespace MailIngest
