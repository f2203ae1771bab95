#include <savings/storage/sqlite_store.hpp>

#include <iostream>
#include <sqlite3.h>

namespace savings::storage {

    // ===========================================
    // Lifecycle
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    Result<void, Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto err = storage_failure(String(("Failed to open " + path + ": " +
                                               (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)))
                                                  .c_str()));
            std::cerr << "SqliteStore: " << err.message.c_str() << std::endl;
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return Result<void, Error>::err(err);
        }

        db_path_ = path;
        applyPragmas(opts);

        auto schema = initializeSchema();
        if (!schema.is_ok()) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
            return schema;
        }

        is_open_ = true;
        return Result<void, Error>::ok();
    }

    void SqliteStore::close() {
        std::lock_guard lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        is_open_ = false;
    }

    bool SqliteStore::isOpen() const {
        std::lock_guard lock(mutex_);
        return is_open_;
    }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        sqlite3_busy_timeout(db_, opts.busy_timeout_ms);

        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sqlite3_exec(db_, "PRAGMA synchronous=OFF;", nullptr, nullptr, nullptr);
            break;
        case OpenOptions::Synchronous::NORMAL:
            sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
            break;
        case OpenOptions::Synchronous::FULL:
            sqlite3_exec(db_, "PRAGMA synchronous=FULL;", nullptr, nullptr, nullptr);
            break;
        }
    }

    Result<void, Error> SqliteStore::initializeSchema() {
        auto migrations = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        auto accounts = executeSql(ACCOUNTS_TABLE);
        if (!accounts.is_ok())
            return accounts;

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "INSERT OR IGNORE INTO schema_migrations (version, applied_at) VALUES (1, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<void, Error>::err(lastError("prepare schema version"));
        }
        sqlite3_bind_int64(stmt, 1, currentTimestamp());
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return Result<void, Error>::err(lastError("record schema version"));
        }
        return Result<void, Error>::ok();
    }

    Result<void, Error> SqliteStore::executeSql(const char *sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string message = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            return Result<void, Error>::err(storage_failure(String(("SQL error: " + message).c_str())));
        }
        return Result<void, Error>::ok();
    }

    // A zero-length blob, never NULL, so empty records pass the NOT NULL constraint
    void SqliteStore::bindBlob(sqlite3_stmt *stmt, int index, const std::vector<uint8_t> &data) {
        if (data.empty()) {
            sqlite3_bind_zeroblob(stmt, index, 0);
        } else {
            sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
        }
    }

    Error SqliteStore::lastError(const char *context) const {
        std::string message = std::string(context) + ": " + (db_ ? sqlite3_errmsg(db_) : "database closed");
        return storage_failure(String(message.c_str()));
    }

    // ===========================================
    // IRecordStore
    // ===========================================

    Result<void, Error> SqliteStore::allocate(const std::string &key, const std::vector<uint8_t> &initial) {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return Result<void, Error>::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "INSERT INTO accounts (address, data, created_at, updated_at) VALUES (?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<void, Error>::err(lastError("prepare allocate"));
        }

        i64 now = currentTimestamp();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        bindBlob(stmt, 2, initial);
        sqlite3_bind_int64(stmt, 3, now);
        sqlite3_bind_int64(stmt, 4, now);

        int rc = sqlite3_step(stmt);
        int extended = sqlite3_extended_errcode(db_);
        if (rc != SQLITE_DONE) {
            auto err = lastError("allocate");
            sqlite3_finalize(stmt);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
                return Result<void, Error>::err(
                    already_initialized(String(("Record already allocated: " + key).c_str())));
            }
            return Result<void, Error>::err(err);
        }
        sqlite3_finalize(stmt);
        return Result<void, Error>::ok();
    }

    Result<std::vector<uint8_t>, Error> SqliteStore::read(const std::string &key) const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return Result<std::vector<uint8_t>, Error>::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "SELECT data FROM accounts WHERE address = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<std::vector<uint8_t>, Error>::err(lastError("prepare read"));
        }

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return Result<std::vector<uint8_t>, Error>::err(account_not_found(String(("No record at " + key).c_str())));
        }
        if (rc != SQLITE_ROW) {
            auto err = lastError("read");
            sqlite3_finalize(stmt);
            return Result<std::vector<uint8_t>, Error>::err(err);
        }

        const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt, 0));
        int size = sqlite3_column_bytes(stmt, 0);
        std::vector<uint8_t> data;
        if (blob && size > 0) {
            data.assign(blob, blob + size);
        }
        sqlite3_finalize(stmt);

        return Result<std::vector<uint8_t>, Error>::ok(std::move(data));
    }

    Result<void, Error> SqliteStore::write(const std::string &key, const std::vector<uint8_t> &data) {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return Result<void, Error>::err(storage_failure("Store not open"));

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "UPDATE accounts SET data = ?, updated_at = ? WHERE address = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<void, Error>::err(lastError("prepare write"));
        }

        bindBlob(stmt, 1, data);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());
        sqlite3_bind_text(stmt, 3, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return Result<void, Error>::err(lastError("write"));
        }
        if (sqlite3_changes(db_) == 0) {
            return Result<void, Error>::err(account_not_found(String(("No record at " + key).c_str())));
        }
        return Result<void, Error>::ok();
    }

    bool SqliteStore::contains(const std::string &key) const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "SELECT 1 FROM accounts WHERE address = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);
        return exists;
    }

    u64 SqliteStore::count() const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM accounts", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        u64 n = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            n = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return n;
    }

    bool SqliteStore::quickCheck() const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            ok = text && std::string(text) == "ok";
        }
        sqlite3_finalize(stmt);
        return ok;
    }

    i32 SqliteStore::schemaVersion() const {
        std::lock_guard lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_migrations", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        i32 version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return version;
    }

} // namespace savings::storage
