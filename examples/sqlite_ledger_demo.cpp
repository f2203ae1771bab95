/**
 * Example: a savings ledger persisted in SQLite
 *
 * Run it twice: the second run finds the account created by the first one
 * and keeps depositing into it.
 */

#include <savings/ledger/key.hpp>
#include <savings/ledger/ledger.hpp>
#include <savings/storage/sqlite_store.hpp>
#include <fstream>
#include <iostream>
#include <memory>

using namespace savings;
using namespace savings::ledger;
using namespace savings::storage;

// Wallet secret kept next to the database so every run acts as the same owner
dp::Result<Key, dp::Error> loadOrCreateWallet(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (in) {
        std::vector<uint8_t> secret((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return Key::fromSecretBytes(secret);
    }

    auto key = Key::generate();
    if (!key.is_ok())
        return key;

    auto secret = key.value().secretBytes();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(secret.data()), static_cast<std::streamsize>(secret.size()));
    if (!out) {
        return dp::Result<Key, dp::Error>::err(storage_failure("Failed to save wallet"));
    }
    return key;
}

int main(int argc, char **argv) {
    std::string db_path = argc > 1 ? argv[1] : "savings_demo.db";

    auto records = std::make_shared<SqliteStore>();
    auto opened = records->open(db_path);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open database: " << opened.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "Database: " << db_path << " (schema v" << records->schemaVersion() << ")" << std::endl;

    auto wallet = loadOrCreateWallet(db_path + ".wallet");
    if (!wallet.is_ok()) {
        std::cerr << "Wallet error: " << wallet.error().message.c_str() << std::endl;
        return 1;
    }
    KeyIdentityProvider owner(wallet.value());

    LedgerOptions options;
    options.verbose = true;
    Ledger ledger(records, options);

    // The account address is derived from the wallet so reruns find it again
    Address address = wallet.value().pubkey();
    if (!ledger.exists(address)) {
        auto created = ledger.initialize(address, owner);
        if (!created.is_ok()) {
            std::cerr << "Initialize failed: " << created.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Created account " << address.toHex() << std::endl;
    } else {
        std::cout << "Found account " << address.toHex() << std::endl;
    }

    auto deposited = ledger.deposit(address, owner, 100000000);
    if (!deposited.is_ok()) {
        std::cerr << "Deposit failed: " << errorName(deposited.error().code) << std::endl;
        return 1;
    }

    auto balance = ledger.getBalance(address, owner);
    if (!balance.is_ok()) {
        std::cerr << "Balance failed: " << errorName(balance.error().code) << std::endl;
        return 1;
    }
    std::cout << "Balance: " << balance.value() << " lamports" << std::endl;
    std::cout << "Integrity: " << (records->quickCheck() ? "ok" : "FAILED") << std::endl;

    records->close();
    return 0;
}
