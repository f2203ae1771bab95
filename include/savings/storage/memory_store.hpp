#pragma once

#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include "record_store.hpp"

namespace savings::storage {

    // ===========================================
    // MemoryStore - in-process record storage
    // ===========================================

    class MemoryStore : public IRecordStore {
      public:
        MemoryStore() = default;

        MemoryStore(const MemoryStore &) = delete;
        MemoryStore &operator=(const MemoryStore &) = delete;

        inline Result<void, Error> allocate(const std::string &key, const std::vector<uint8_t> &initial) override {
            std::unique_lock lock(mutex_);
            if (records_.find(key) != records_.end()) {
                return Result<void, Error>::err(already_initialized(String(("Record already allocated: " + key).c_str())));
            }
            records_.emplace(key, initial);
            return Result<void, Error>::ok();
        }

        inline Result<std::vector<uint8_t>, Error> read(const std::string &key) const override {
            std::shared_lock lock(mutex_);
            auto it = records_.find(key);
            if (it == records_.end()) {
                return Result<std::vector<uint8_t>, Error>::err(
                    account_not_found(String(("No record at " + key).c_str())));
            }
            return Result<std::vector<uint8_t>, Error>::ok(it->second);
        }

        inline Result<void, Error> write(const std::string &key, const std::vector<uint8_t> &data) override {
            std::unique_lock lock(mutex_);
            auto it = records_.find(key);
            if (it == records_.end()) {
                return Result<void, Error>::err(account_not_found(String(("No record at " + key).c_str())));
            }
            it->second = data;
            return Result<void, Error>::ok();
        }

        inline bool contains(const std::string &key) const override {
            std::shared_lock lock(mutex_);
            return records_.find(key) != records_.end();
        }

        inline u64 count() const override {
            std::shared_lock lock(mutex_);
            return static_cast<u64>(records_.size());
        }

        /// Overwrite raw bytes without any checks (test hook for corrupt records)
        inline void poke(const std::string &key, const std::vector<uint8_t> &data) {
            std::unique_lock lock(mutex_);
            records_[key] = data;
        }

      private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::vector<uint8_t>> records_;
    };

} // namespace savings::storage
