#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "record_store.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace savings::storage {

    // ===========================================
    // SqliteStore - account records in one SQLite table
    // ===========================================

    class SqliteStore : public IRecordStore {
      public:
        SqliteStore();
        ~SqliteStore() override;

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path and apply the schema
        /// @param path Database file path (e.g. "data/savings.db"), or ":memory:"
        /// @param opts Configuration options
        Result<void, Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        // ===========================================
        // IRecordStore
        // ===========================================

        Result<void, Error> allocate(const std::string &key, const std::vector<uint8_t> &initial) override;
        Result<std::vector<uint8_t>, Error> read(const std::string &key) const override;
        Result<void, Error> write(const std::string &key, const std::vector<uint8_t> &data) override;
        bool contains(const std::string &key) const override;
        u64 count() const override;

        /// Run SQLite integrity check
        /// @return true if database is healthy, false on corruption
        bool quickCheck() const;

        /// Schema version recorded in schema_migrations (0 when none)
        i32 schemaVersion() const;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        Result<void, Error> initializeSchema();
        Result<void, Error> executeSql(const char *sql);
        Error lastError(const char *context) const;
        static void bindBlob(sqlite3_stmt *stmt, int index, const std::vector<uint8_t> &data);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *ACCOUNTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS accounts (
                address TEXT PRIMARY KEY,
                data BLOB NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";
    };

} // namespace savings::storage
