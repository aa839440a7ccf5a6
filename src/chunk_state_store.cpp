// src/chunk_state_store.cpp
#include "chunk_state_store.hpp"
#include "ingest_config.hpp"
#include "mail_date.hpp"

#include <iostream> // For logging
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace fs = std::filesystem;

namespace MailIngest
{
    namespace State
    {

        namespace
        {

            const char *CHUNK_COLUMNS =
                "chunk_id, original_file, path, size_bytes, message_count, date_start, date_end, hash, "
                "labels, status, resume_offset, created_at, processed_at, registration_seq";

            std::string sqliteError(sqlite3 *db, const std::string &what)
            {
                return what + ": " + (db ? sqlite3_errmsg(db) : "no database handle");
            }

            // Prepared statement that finalizes itself.
            class Statement
            {
            public:
                Statement(sqlite3 *db, const std::string &sql) : db(db)
                {
                    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
                    {
                        throw std::runtime_error(sqliteError(db, "prepare failed"));
                    }
                }
                ~Statement() { sqlite3_finalize(st); }

                Statement(const Statement &) = delete;
                Statement &operator=(const Statement &) = delete;

                void bind(int index, const std::string &value)
                {
                    check(sqlite3_bind_text(st, index, value.c_str(), -1, SQLITE_TRANSIENT));
                }
                void bind(int index, int64_t value)
                {
                    check(sqlite3_bind_int64(st, index, value));
                }
                void bindNull(int index)
                {
                    check(sqlite3_bind_null(st, index));
                }
                void bind(int index, const std::optional<std::string> &value)
                {
                    if (value)
                        bind(index, *value);
                    else
                        bindNull(index);
                }
                void bind(int index, const std::optional<uint64_t> &value)
                {
                    if (value)
                        bind(index, static_cast<int64_t>(*value));
                    else
                        bindNull(index);
                }

                // true while rows are produced, false once done.
                bool step()
                {
                    int rc = sqlite3_step(st);
                    if (rc == SQLITE_ROW)
                        return true;
                    if (rc == SQLITE_DONE)
                        return false;
                    throw std::runtime_error(sqliteError(db, "step failed"));
                }

                bool isNull(int col) const { return sqlite3_column_type(st, col) == SQLITE_NULL; }
                int64_t int64(int col) const { return sqlite3_column_int64(st, col); }
                std::string text(int col) const
                {
                    const unsigned char *value = sqlite3_column_text(st, col);
                    return value ? reinterpret_cast<const char *>(value) : "";
                }
                std::optional<std::string> optionalText(int col) const
                {
                    if (isNull(col))
                        return std::nullopt;
                    return text(col);
                }

            private:
                void check(int rc)
                {
                    if (rc != SQLITE_OK)
                        throw std::runtime_error(sqliteError(db, "bind failed"));
                }

                sqlite3 *db;
                sqlite3_stmt *st = nullptr;
            };

            // BEGIN IMMEDIATE ... COMMIT, rolled back unless committed.
            class Transaction
            {
            public:
                explicit Transaction(sqlite3 *db) : db(db)
                {
                    run("BEGIN IMMEDIATE;");
                }
                ~Transaction()
                {
                    if (!done)
                    {
                        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
                    }
                }
                void commit()
                {
                    run("COMMIT;");
                    done = true;
                }

            private:
                void run(const char *sql)
                {
                    char *err = nullptr;
                    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK)
                    {
                        std::string msg = err ? err : "sqlite error";
                        sqlite3_free(err);
                        throw std::runtime_error(std::string(sql) + " failed: " + msg);
                    }
                }

                sqlite3 *db;
                bool done = false;
            };

            std::optional<std::string> optionalIso(const std::optional<Mail::TimePoint> &tp)
            {
                if (!tp)
                    return std::nullopt;
                return Mail::formatIso8601(*tp);
            }

            std::optional<Mail::TimePoint> readTime(const std::optional<std::string> &value)
            {
                if (!value)
                    return std::nullopt;
                return Mail::parseIso8601(*value);
            }

            ChunkRecord readRecord(const Statement &st)
            {
                ChunkRecord record;
                record.metadata.chunk_id = st.text(0);
                record.archive_path = st.text(1);
                record.metadata.path = st.text(2);
                record.metadata.size_bytes = static_cast<uint64_t>(st.int64(3));
                record.metadata.message_count = static_cast<uint64_t>(st.int64(4));
                record.metadata.date_range.start = readTime(st.optionalText(5));
                record.metadata.date_range.end = readTime(st.optionalText(6));
                record.metadata.content_hash = st.text(7);
                try
                {
                    record.metadata.labels = nlohmann::json::parse(st.text(8)).get<std::vector<std::string>>();
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw std::runtime_error("Corrupt labels for chunk " + record.metadata.chunk_id + ": " + e.what());
                }
                record.status = Chunks::statusFromString(st.text(9));
                if (!st.isNull(10))
                {
                    record.resume_offset = static_cast<uint64_t>(st.int64(10));
                }
                record.created_at = st.text(11);
                record.processed_at = st.optionalText(12);
                record.registration_seq = st.int64(13);
                return record;
            }

            std::string orderClause(Chunks::WorkOrder order)
            {
                if (order == Chunks::WorkOrder::Size)
                {
                    return " ORDER BY size_bytes ASC, registration_seq ASC";
                }
                return " ORDER BY date_start IS NULL, date_start ASC, registration_seq ASC";
            }

        } // namespace

        ChunkStateStore::ChunkStateStore(const fs::path &db_path) : db_path(db_path)
        {
            if (db_path.has_parent_path())
            {
                Config::IngestConfig::ensureDirectoryExists(db_path.parent_path());
            }
            if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK)
            {
                std::string msg = sqliteError(db, "sqlite3_open failed for " + db_path.string());
                sqlite3_close(db);
                db = nullptr;
                throw std::runtime_error(msg);
            }
            sqlite3_busy_timeout(db, 5000);
            exec("PRAGMA journal_mode=WAL;");
            exec("PRAGMA synchronous=NORMAL;");
            exec("PRAGMA foreign_keys=ON;");
            ensureSchema();
            std::cout << "[ChunkStateStore] Opened " << db_path << std::endl;
        }

        ChunkStateStore::~ChunkStateStore()
        {
            if (db)
                sqlite3_close(db);
        }

        void ChunkStateStore::exec(const char *sql)
        {
            char *err = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK)
            {
                std::string msg = err ? err : "sqlite error";
                sqlite3_free(err);
                throw std::runtime_error(msg);
            }
        }

        void ChunkStateStore::ensureSchema()
        {
            exec(
                "CREATE TABLE IF NOT EXISTS chunks ("
                "  chunk_id TEXT PRIMARY KEY,"
                "  registration_seq INTEGER NOT NULL,"
                "  original_file TEXT NOT NULL,"
                "  path TEXT NOT NULL,"
                "  size_bytes INTEGER NOT NULL,"
                "  message_count INTEGER NOT NULL,"
                "  date_start TEXT,"
                "  date_end TEXT,"
                "  hash TEXT NOT NULL,"
                "  labels TEXT NOT NULL DEFAULT '[]',"
                "  status TEXT NOT NULL DEFAULT 'pending',"
                "  resume_offset INTEGER,"
                "  created_at TEXT NOT NULL,"
                "  processed_at TEXT"
                ");");
            exec(
                "CREATE TABLE IF NOT EXISTS processing_log ("
                "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  chunk_id TEXT NOT NULL,"
                "  status TEXT NOT NULL,"
                "  message_offset INTEGER,"
                "  error TEXT,"
                "  timestamp TEXT NOT NULL,"
                "  FOREIGN KEY(chunk_id) REFERENCES chunks(chunk_id)"
                ");");
            exec("CREATE INDEX IF NOT EXISTS idx_chunks_status ON chunks(status);");
            exec("CREATE INDEX IF NOT EXISTS idx_chunks_original_file ON chunks(original_file);");
            exec("CREATE INDEX IF NOT EXISTS idx_processing_log_chunk_id ON processing_log(chunk_id);");
        }

        void ChunkStateStore::upsertChunk(const Chunks::ChunkMetadata &chunk, const std::string &archive_path)
        {
            Statement st(db,
                         "INSERT INTO chunks (chunk_id, registration_seq, original_file, path, size_bytes, message_count,"
                         "  date_start, date_end, hash, labels, status, resume_offset, created_at, processed_at) "
                         "VALUES (?1, (SELECT COALESCE(MAX(registration_seq), 0) + 1 FROM chunks), ?2, ?3, ?4, ?5,"
                         "  ?6, ?7, ?8, ?9, 'pending', NULL, ?10, NULL) "
                         "ON CONFLICT(chunk_id) DO UPDATE SET "
                         "  original_file=excluded.original_file, path=excluded.path, size_bytes=excluded.size_bytes,"
                         "  message_count=excluded.message_count, date_start=excluded.date_start,"
                         "  date_end=excluded.date_end, hash=excluded.hash, labels=excluded.labels,"
                         "  status='pending', resume_offset=NULL, processed_at=NULL;");
            st.bind(1, chunk.chunk_id);
            st.bind(2, archive_path);
            st.bind(3, chunk.path);
            st.bind(4, static_cast<int64_t>(chunk.size_bytes));
            st.bind(5, static_cast<int64_t>(chunk.message_count));
            st.bind(6, optionalIso(chunk.date_range.start));
            st.bind(7, optionalIso(chunk.date_range.end));
            st.bind(8, chunk.content_hash);
            st.bind(9, nlohmann::json(chunk.labels).dump());
            st.bind(10, Mail::nowIso8601());
            st.step();
            appendLog(chunk.chunk_id, Chunks::ChunkStatus::Pending, std::nullopt, std::nullopt);
        }

        void ChunkStateStore::registerChunk(const Chunks::ChunkMetadata &chunk, const std::string &archive_path)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Transaction tx(db);
            upsertChunk(chunk, archive_path);
            tx.commit();
        }

        void ChunkStateStore::registerChunks(const std::vector<Chunks::ChunkMetadata> &chunks, const std::string &archive_path)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Transaction tx(db);
            for (const auto &chunk : chunks)
            {
                upsertChunk(chunk, archive_path);
            }
            tx.commit();
            std::cout << "[ChunkStateStore] Registered " << chunks.size() << " chunks for " << archive_path << std::endl;
        }

        void ChunkStateStore::appendLog(const std::string &chunk_id, Chunks::ChunkStatus status,
                                        std::optional<uint64_t> offset, const std::optional<std::string> &error)
        {
            // Without an explicit offset the entry records the chunk's current resume offset.
            Statement st(db,
                         "INSERT INTO processing_log (chunk_id, status, message_offset, error, timestamp) "
                         "VALUES (?1, ?2, COALESCE(?3, (SELECT resume_offset FROM chunks WHERE chunk_id = ?1)), ?4, ?5);");
            st.bind(1, chunk_id);
            st.bind(2, Chunks::toString(status));
            st.bind(3, offset);
            st.bind(4, error);
            st.bind(5, Mail::nowIso8601());
            st.step();
        }

        bool ChunkStateStore::transition(const std::string &chunk_id, const char *update_sql,
                                         std::optional<int64_t> int_param, const std::optional<std::string> &text_param,
                                         Chunks::ChunkStatus target, std::optional<uint64_t> logged_offset,
                                         const std::optional<std::string> &error)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Transaction tx(db);

            Statement update(db, update_sql);
            update.bind(1, chunk_id);
            if (int_param)
                update.bind(2, *int_param);
            else if (text_param)
                update.bind(2, *text_param);
            update.step();

            if (sqlite3_changes(db) != 1)
            {
                return false; // Unknown chunk or not in a source state; rolled back
            }
            appendLog(chunk_id, target, logged_offset, error);
            tx.commit();
            return true;
        }

        bool ChunkStateStore::claim(const std::string &chunk_id, uint64_t offset)
        {
            return transition(chunk_id,
                              "UPDATE chunks SET status = 'processing', resume_offset = ?2 "
                              "WHERE chunk_id = ?1 AND status = 'pending';",
                              static_cast<int64_t>(offset), std::nullopt,
                              Chunks::ChunkStatus::Processing, offset, std::nullopt);
        }

        std::optional<std::string> ChunkStateStore::selectNextPending(Chunks::WorkOrder order, const std::string &archive_path) const
        {
            std::string sql = "SELECT chunk_id FROM chunks WHERE status = 'pending'";
            if (!archive_path.empty())
            {
                sql += " AND original_file = ?1";
            }
            sql += orderClause(order) + " LIMIT 1;";

            Statement st(db, sql);
            if (!archive_path.empty())
            {
                st.bind(1, archive_path);
            }
            if (st.step())
            {
                return st.text(0);
            }
            return std::nullopt;
        }

        std::optional<ChunkRecord> ChunkStateStore::claimNext(Chunks::WorkOrder order, const std::string &archive_path)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Transaction tx(db);

            auto chunk_id = selectNextPending(order, archive_path);
            if (!chunk_id)
            {
                tx.commit();
                return std::nullopt;
            }

            Statement update(db,
                             "UPDATE chunks SET status = 'processing', resume_offset = 0 "
                             "WHERE chunk_id = ?1 AND status = 'pending';");
            update.bind(1, *chunk_id);
            update.step();
            if (sqlite3_changes(db) != 1)
            {
                return std::nullopt;
            }
            appendLog(*chunk_id, Chunks::ChunkStatus::Processing, 0, std::nullopt);

            auto record = fetchChunk(*chunk_id);
            tx.commit();
            std::cout << "[ChunkStateStore] Claimed " << *chunk_id << std::endl;
            return record;
        }

        std::optional<ChunkRecord> ChunkStateStore::nextPending(Chunks::WorkOrder order, const std::string &archive_path) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto chunk_id = selectNextPending(order, archive_path);
            if (!chunk_id)
            {
                return std::nullopt;
            }
            return fetchChunk(*chunk_id);
        }

        bool ChunkStateStore::recordProgress(const std::string &chunk_id, uint64_t offset)
        {
            return transition(chunk_id,
                              "UPDATE chunks SET resume_offset = ?2 WHERE chunk_id = ?1 AND status = 'processing';",
                              static_cast<int64_t>(offset), std::nullopt,
                              Chunks::ChunkStatus::Processing, offset, std::nullopt);
        }

        bool ChunkStateStore::complete(const std::string &chunk_id)
        {
            bool ok = transition(chunk_id,
                                 "UPDATE chunks SET status = 'completed', processed_at = ?2 "
                                 "WHERE chunk_id = ?1 AND status = 'processing';",
                                 std::nullopt, Mail::nowIso8601(),
                                 Chunks::ChunkStatus::Completed, std::nullopt, std::nullopt);
            if (ok)
            {
                std::cout << "[ChunkStateStore] Chunk completed: " << chunk_id << std::endl;
            }
            return ok;
        }

        bool ChunkStateStore::fail(const std::string &chunk_id, const std::string &error)
        {
            bool ok = transition(chunk_id,
                                 "UPDATE chunks SET status = 'failed' WHERE chunk_id = ?1 AND status = 'processing';",
                                 std::nullopt, std::nullopt,
                                 Chunks::ChunkStatus::Failed, std::nullopt, error);
            if (ok)
            {
                std::cerr << "[ChunkStateStore] Chunk failed: " << chunk_id << ": " << error << std::endl;
            }
            return ok;
        }

        bool ChunkStateStore::reset(const std::string &chunk_id)
        {
            bool ok = transition(chunk_id,
                                 "UPDATE chunks SET status = 'pending', processed_at = NULL, resume_offset = NULL "
                                 "WHERE chunk_id = ?1 AND status IN ('completed', 'failed');",
                                 std::nullopt, std::nullopt,
                                 Chunks::ChunkStatus::Pending, std::nullopt, std::nullopt);
            if (ok)
            {
                std::cout << "[ChunkStateStore] Chunk reset to pending: " << chunk_id << std::endl;
            }
            return ok;
        }

        bool ChunkStateStore::setLabels(const std::string &chunk_id, const std::vector<std::string> &labels)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "UPDATE chunks SET labels = ?2 WHERE chunk_id = ?1;");
            st.bind(1, chunk_id);
            st.bind(2, nlohmann::json(labels).dump());
            st.step();
            return sqlite3_changes(db) == 1;
        }

        std::optional<ChunkRecord> ChunkStateStore::fetchChunk(const std::string &chunk_id) const
        {
            Statement st(db, std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE chunk_id = ?1;");
            st.bind(1, chunk_id);
            if (st.step())
            {
                return readRecord(st);
            }
            return std::nullopt;
        }

        std::optional<ChunkRecord> ChunkStateStore::get(const std::string &chunk_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return fetchChunk(chunk_id);
        }

        std::vector<ChunkRecord> ChunkStateStore::getByArchive(const std::string &archive_path) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, std::string("SELECT ") + CHUNK_COLUMNS +
                                 " FROM chunks WHERE original_file = ?1 ORDER BY registration_seq ASC;");
            st.bind(1, archive_path);
            std::vector<ChunkRecord> records;
            while (st.step())
            {
                records.push_back(readRecord(st));
            }
            return records;
        }

        std::vector<ChunkRecord> ChunkStateStore::getByStatus(Chunks::ChunkStatus status, const std::string &archive_path) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            std::string sql = std::string("SELECT ") + CHUNK_COLUMNS + " FROM chunks WHERE status = ?1";
            if (!archive_path.empty())
            {
                sql += " AND original_file = ?2";
            }
            sql += " ORDER BY registration_seq ASC;";

            Statement st(db, sql);
            st.bind(1, Chunks::toString(status));
            if (!archive_path.empty())
            {
                st.bind(2, archive_path);
            }
            std::vector<ChunkRecord> records;
            while (st.step())
            {
                records.push_back(readRecord(st));
            }
            return records;
        }

        std::vector<ProcessingLogEntry> ChunkStateStore::getLog(const std::string &chunk_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db,
                         "SELECT id, chunk_id, status, message_offset, error, timestamp "
                         "FROM processing_log WHERE chunk_id = ?1 ORDER BY id ASC;");
            st.bind(1, chunk_id);
            std::vector<ProcessingLogEntry> entries;
            while (st.step())
            {
                ProcessingLogEntry entry;
                entry.id = st.int64(0);
                entry.chunk_id = st.text(1);
                entry.status = Chunks::statusFromString(st.text(2));
                if (!st.isNull(3))
                {
                    entry.offset = static_cast<uint64_t>(st.int64(3));
                }
                entry.error = st.optionalText(4);
                entry.timestamp = st.text(5);
                entries.push_back(std::move(entry));
            }
            return entries;
        }

        uint64_t ChunkStateStore::getResumePoint(const std::string &chunk_id) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "SELECT resume_offset FROM chunks WHERE chunk_id = ?1;");
            st.bind(1, chunk_id);
            if (st.step() && !st.isNull(0))
            {
                return static_cast<uint64_t>(st.int64(0));
            }
            return 0;
        }

        ChunkStats ChunkStateStore::getStats() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db,
                         "SELECT COUNT(*),"
                         "  COALESCE(SUM(CASE WHEN status = 'pending' THEN 1 ELSE 0 END), 0),"
                         "  COALESCE(SUM(CASE WHEN status = 'processing' THEN 1 ELSE 0 END), 0),"
                         "  COALESCE(SUM(CASE WHEN status = 'completed' THEN 1 ELSE 0 END), 0),"
                         "  COALESCE(SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END), 0) "
                         "FROM chunks;");
            ChunkStats stats;
            if (st.step())
            {
                stats.total = static_cast<uint64_t>(st.int64(0));
                stats.pending = static_cast<uint64_t>(st.int64(1));
                stats.processing = static_cast<uint64_t>(st.int64(2));
                stats.completed = static_cast<uint64_t>(st.int64(3));
                stats.failed = static_cast<uint64_t>(st.int64(4));
            }
            return stats;
        }

        void ChunkStateStore::clearAll()
        {
            std::lock_guard<std::mutex> lock(mtx);
            Transaction tx(db);
            exec("DELETE FROM processing_log;");
            exec("DELETE FROM chunks;");
            tx.commit();
            std::cerr << "[ChunkStateStore] All chunks and processing log entries cleared" << std::endl;
        }

    } // namespace State
} // namespace MailIngest
