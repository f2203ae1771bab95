#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <thread>

#include "record_store.hpp"

namespace savings::storage {

    // ===========================================
    // FileStore - one file per record
    // ===========================================

    /// Records live as <base>/<key>.acct. Creation goes through an exclusive
    /// hard link and updates through rename, so each call is atomic on POSIX
    /// filesystems.
    class FileStore : public IRecordStore {
      public:
        static constexpr const char *RECORD_EXTENSION = ".acct";

        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() override { close(); }

        // Non-copyable, non-movable (handed out behind shared_ptr)
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            std::unique_lock lock(mutex_);
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                removeStaleTemporaries();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                std::cerr << "FileStore: failed to open " << path.c_str() << ": " << e.what() << std::endl;
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        /// Close storage
        inline void close() {
            std::unique_lock lock(mutex_);
            is_open_ = false;
        }

        /// Check if storage is open
        inline bool isOpen() const {
            std::shared_lock lock(mutex_);
            return is_open_;
        }

        inline const std::filesystem::path &basePath() const { return base_path_; }

        // ===========================================
        // IRecordStore
        // ===========================================

        inline Result<void, Error> allocate(const std::string &key, const std::vector<uint8_t> &initial) override {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(storage_failure("Store not open"));

            auto target = recordPath(key);
            auto temp = tempPath(key);
            try {
                writeFile(temp, initial);

                std::error_code ec;
                std::filesystem::create_hard_link(temp, target, ec);
                std::filesystem::remove(temp);
                if (ec) {
                    if (ec == std::errc::file_exists) {
                        return Result<void, Error>::err(
                            already_initialized(String(("Record already allocated: " + key).c_str())));
                    }
                    return Result<void, Error>::err(storage_failure(String(ec.message().c_str())));
                }
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        inline Result<std::vector<uint8_t>, Error> read(const std::string &key) const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<std::vector<uint8_t>, Error>::err(storage_failure("Store not open"));

            auto path = recordPath(key);
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return Result<std::vector<uint8_t>, Error>::err(
                    account_not_found(String(("No record at " + key).c_str())));
            }

            std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (in.bad()) {
                return Result<std::vector<uint8_t>, Error>::err(
                    storage_failure(String(("Failed to read record " + key).c_str())));
            }
            return Result<std::vector<uint8_t>, Error>::ok(std::move(data));
        }

        inline Result<void, Error> write(const std::string &key, const std::vector<uint8_t> &data) override {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(storage_failure("Store not open"));

            auto target = recordPath(key);
            std::error_code ec;
            if (!std::filesystem::exists(target, ec)) {
                if (ec) {
                    return Result<void, Error>::err(storage_failure(String(ec.message().c_str())));
                }
                return Result<void, Error>::err(account_not_found(String(("No record at " + key).c_str())));
            }

            auto temp = tempPath(key);
            try {
                writeFile(temp, data);
                std::filesystem::rename(temp, target);
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                return Result<void, Error>::err(storage_failure(String(e.what())));
            }
        }

        inline bool contains(const std::string &key) const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return false;
            std::error_code ec;
            return std::filesystem::exists(recordPath(key), ec);
        }

        inline u64 count() const override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return 0;

            u64 n = 0;
            std::error_code ec;
            for (const auto &entry : std::filesystem::directory_iterator(base_path_, ec)) {
                std::error_code entry_ec;
                if (entry.is_regular_file(entry_ec) && entry.path().extension() == RECORD_EXTENSION)
                    ++n;
            }
            return n;
        }

      private:
        inline std::filesystem::path recordPath(const std::string &key) const {
            return base_path_ / (key + RECORD_EXTENSION);
        }

        inline std::filesystem::path tempPath(const std::string &key) const {
            auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
            return base_path_ / (key + ".tmp." + std::to_string(tid) + "." + std::to_string(temp_counter_++));
        }

        inline void writeFile(const std::filesystem::path &file, const std::vector<uint8_t> &data) const {
            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            if (!out)
                throw std::runtime_error("Failed to open file for writing: " + file.string());

            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));

            if (sync_mode_ != OpenOptions::Synchronous::OFF) {
                out.flush();
            }
            if (!out)
                throw std::runtime_error("Failed to write file: " + file.string());
        }

        // Leftovers from an interrupted allocate/write are never visible as records
        inline void removeStaleTemporaries() {
            for (const auto &entry : std::filesystem::directory_iterator(base_path_)) {
                if (entry.is_regular_file() && entry.path().filename().string().find(".tmp.") != std::string::npos) {
                    std::filesystem::remove(entry.path());
                }
            }
        }

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;
        mutable std::atomic<u64> temp_counter_{0};
        mutable std::shared_mutex mutex_;
    };

} // namespace savings::storage
