#include "test_helpers.hpp"
#include <doctest/doctest.h>

using namespace savings;
using namespace savings::ledger;
using namespace savings::storage;

TEST_SUITE("Account Store Tests") {

    TEST_CASE("Create then load") {
        auto records = savings::test::memoryStore();
        AccountStore accounts(records);

        auto address = savings::test::pubkeyOf(0xA1);
        auto owner = savings::test::pubkeyOf(0x01);

        auto created = accounts.create(address, owner);
        REQUIRE(created.is_ok());
        CHECK(created.value().total_deposits == 0);

        auto loaded = accounts.load(address);
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().owner == owner);
        CHECK(loaded.value().total_deposits == 0);
        CHECK(accounts.exists(address));
        CHECK(accounts.size() == 1);
    }

    TEST_CASE("Create twice fails and keeps the first record") {
        auto records = savings::test::memoryStore();
        AccountStore accounts(records);

        auto address = savings::test::pubkeyOf(0xA1);
        REQUIRE(accounts.create(address, savings::test::pubkeyOf(1)).is_ok());

        auto second = accounts.create(address, savings::test::pubkeyOf(2));
        REQUIRE(second.is_err());
        CHECK(isError(second.error(), ERR_ALREADY_INITIALIZED));

        CHECK(accounts.load(address).value().owner == savings::test::pubkeyOf(1));
    }

    TEST_CASE("Load of unknown address is NotFound") {
        AccountStore accounts(savings::test::memoryStore());

        auto loaded = accounts.load(savings::test::pubkeyOf(0xEE));
        REQUIRE(loaded.is_err());
        CHECK(isError(loaded.error(), ERR_ACCOUNT_NOT_FOUND));
        CHECK_FALSE(accounts.exists(savings::test::pubkeyOf(0xEE)));
    }

    TEST_CASE("Store persists the full record") {
        AccountStore accounts(savings::test::memoryStore());
        auto address = savings::test::pubkeyOf(0xA2);
        auto account = accounts.create(address, savings::test::pubkeyOf(1)).value();

        account.total_deposits = 42;
        REQUIRE(accounts.store(address, account).is_ok());
        CHECK(accounts.load(address).value().total_deposits == 42);
    }

    TEST_CASE("Store to unknown address is NotFound") {
        AccountStore accounts(savings::test::memoryStore());

        auto stored = accounts.store(savings::test::pubkeyOf(0xA3), Account(savings::test::pubkeyOf(1)));
        REQUIRE(stored.is_err());
        CHECK(isError(stored.error(), ERR_ACCOUNT_NOT_FOUND));
    }

    TEST_CASE("Corrupt bytes surface as CorruptRecord") {
        auto records = savings::test::memoryStore();
        AccountStore accounts(records);
        auto address = savings::test::pubkeyOf(0xA4);

        records->poke(address.toHex(), std::vector<uint8_t>(12, 0xFF));

        auto loaded = accounts.load(address);
        REQUIRE(loaded.is_err());
        CHECK(isError(loaded.error(), ERR_CORRUPT_RECORD));
    }
}
