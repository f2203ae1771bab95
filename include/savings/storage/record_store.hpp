#pragma once

#include <chrono>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <tuple>
#include <vector>

#include "savings/common/error.hpp"

namespace savings::storage {

    using namespace datapod;

    inline i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Storage configuration options
    struct OpenOptions {
        bool enable_wal = true;     // SqliteStore only
        i32 busy_timeout_ms = 5000; // SqliteStore only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL; // FileStore: FULL flushes like NORMAL, no fsync

        auto members() { return std::tie(enable_wal, busy_timeout_ms, sync_mode); }
        auto members() const { return std::tie(enable_wal, busy_timeout_ms, sync_mode); }
    };

    // ===========================================
    // Record substrate - implemented by each backend
    // ===========================================

    /// Keyed fixed-size record storage.
    /// Every call is atomic from the caller's point of view: a reader sees either
    /// the previous bytes or the new bytes, never a mix.
    class IRecordStore {
      public:
        virtual ~IRecordStore() = default;

        /// Reserve a record at key and fill it with initial bytes.
        /// Fails with ERR_ALREADY_INITIALIZED if the key is taken.
        virtual Result<void, Error> allocate(const std::string &key, const std::vector<uint8_t> &initial) = 0;

        /// Read the full record. Fails with ERR_ACCOUNT_NOT_FOUND if the key is free.
        virtual Result<std::vector<uint8_t>, Error> read(const std::string &key) const = 0;

        /// Replace an existing record. Fails with ERR_ACCOUNT_NOT_FOUND if the key is free.
        virtual Result<void, Error> write(const std::string &key, const std::vector<uint8_t> &data) = 0;

        virtual bool contains(const std::string &key) const = 0;

        virtual u64 count() const = 0;
    };

} // namespace savings::storage
