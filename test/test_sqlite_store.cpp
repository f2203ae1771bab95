#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include <filesystem>
#include <thread>

using namespace savings;
using namespace savings::storage;
using savings::test::pubkeyOf;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    std::shared_ptr<SqliteStore> store = std::make_shared<SqliteStore>();

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store->close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

// ===========================================
// Lifecycle tests
// ===========================================

TEST_CASE("SqliteStore lifecycle") {
    TestDB db("test_sqlite_lifecycle");

    SUBCASE("Open and close") {
        auto result = db.store->open(db.path);
        REQUIRE(result.is_ok());
        CHECK(db.store->isOpen());
        CHECK(std::filesystem::exists(db.path));

        db.store->close();
        CHECK_FALSE(db.store->isOpen());
    }

    SUBCASE("Schema is versioned") {
        REQUIRE(db.store->open(db.path).is_ok());
        CHECK(db.store->schemaVersion() == 1);

        // Reopening does not bump the version
        db.store->close();
        REQUIRE(db.store->open(db.path).is_ok());
        CHECK(db.store->schemaVersion() == 1);
    }

    SUBCASE("Integrity check") {
        REQUIRE(db.store->open(db.path).is_ok());
        CHECK(db.store->quickCheck());
    }

    SUBCASE("Custom options") {
        OpenOptions opts;
        opts.enable_wal = false;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        opts.busy_timeout_ms = 1000;

        REQUIRE(db.store->open(db.path, opts).is_ok());
        CHECK(db.store->isOpen());
    }

    SUBCASE("Closed store rejects operations") {
        CHECK(db.store->allocate("a", {1}).is_err());
        CHECK(db.store->read("a").is_err());
        CHECK(db.store->count() == 0);
    }
}

// ===========================================
// Record operations
// ===========================================

TEST_CASE("SqliteStore records") {
    TestDB db("test_sqlite_records");
    REQUIRE(db.store->open(db.path).is_ok());
    auto &store = *db.store;

    SUBCASE("Allocate then read") {
        std::vector<uint8_t> bytes = {0x53, 0x41, 0x56, 0x00, 0xFF};
        REQUIRE(store.allocate("key1", bytes).is_ok());

        auto read = store.read("key1");
        REQUIRE(read.is_ok());
        CHECK(read.value() == bytes);
        CHECK(store.contains("key1"));
        CHECK(store.count() == 1);
    }

    SUBCASE("Allocate twice keeps the first record") {
        REQUIRE(store.allocate("key1", {1}).is_ok());

        auto second = store.allocate("key1", {2});
        REQUIRE(second.is_err());
        CHECK(isError(second.error(), ERR_ALREADY_INITIALIZED));
        CHECK(store.read("key1").value() == std::vector<uint8_t>{1});
    }

    SUBCASE("Read and write of a free key") {
        auto read = store.read("missing");
        REQUIRE(read.is_err());
        CHECK(isError(read.error(), ERR_ACCOUNT_NOT_FOUND));

        auto write = store.write("missing", {1});
        REQUIRE(write.is_err());
        CHECK(isError(write.error(), ERR_ACCOUNT_NOT_FOUND));
        CHECK(store.count() == 0);
    }

    SUBCASE("Write replaces the record") {
        REQUIRE(store.allocate("key1", {1, 1}).is_ok());
        REQUIRE(store.write("key1", {7, 7, 7}).is_ok());
        CHECK(store.read("key1").value() == std::vector<uint8_t>{7, 7, 7});
        CHECK(store.count() == 1);
    }
}

// ===========================================
// Ledger on SQLite
// ===========================================

TEST_CASE("Ledger state survives reopening the database") {
    TestDB db("test_sqlite_ledger");
    REQUIRE(db.store->open(db.path).is_ok());

    auto account = pubkeyOf(0xB0);
    auto owner = pubkeyOf(0x01);
    {
        ledger::Ledger ledger(db.store);
        REQUIRE(ledger.initialize(account, owner).is_ok());
        REQUIRE(ledger.deposit(account, owner, 100000000).is_ok());
        REQUIRE(ledger.deposit(account, owner, 100000000).is_ok());
    }
    db.store->close();

    REQUIRE(db.store->open(db.path).is_ok());
    ledger::Ledger ledger(db.store);

    CHECK(ledger.accountCount() == 1);
    CHECK(ledger.getBalance(account, owner).value() == 200000000);
    CHECK(ledger.withdraw(account, owner, 100000000).value() == 100000000);

    auto foreign = ledger.getBalance(account, pubkeyOf(0x02));
    REQUIRE(foreign.is_err());
    CHECK(isError(foreign.error(), ERR_UNAUTHORIZED));
}

TEST_CASE("Concurrent deposits through SQLite sum exactly") {
    TestDB db("test_sqlite_concurrent");
    REQUIRE(db.store->open(db.path).is_ok());

    auto account = pubkeyOf(0xB1);
    auto owner = pubkeyOf(0x01);
    ledger::Ledger ledger(db.store);
    REQUIRE(ledger.initialize(account, owner).is_ok());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&ledger, &account, &owner]() {
            for (int i = 0; i < 25; ++i) {
                auto result = ledger.deposit(account, owner, 10);
                (void)result;
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    CHECK(ledger.getBalance(account, owner).value() == 4 * 25 * 10);
}

TEST_CASE("SqliteStore constraint handling") {
    TestDB db("test_sqlite_constraints");
    REQUIRE(db.store->open(db.path).is_ok());
    auto &store = *db.store;

    SUBCASE("Empty records are stored, not rejected") {
        auto allocated = store.allocate("empty", {});
        REQUIRE(allocated.is_ok());

        auto read = store.read("empty");
        REQUIRE(read.is_ok());
        CHECK(read.value().empty());

        REQUIRE(store.write("empty", {}).is_ok());
        CHECK(store.count() == 1);
    }

    SUBCASE("Only a taken key is AlreadyInitialized") {
        REQUIRE(store.allocate("empty", {}).is_ok());

        auto again = store.allocate("empty", {1});
        REQUIRE(again.is_err());
        CHECK(isError(again.error(), ERR_ALREADY_INITIALIZED));
    }
}
