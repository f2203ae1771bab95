#include "savings.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

using namespace savings;
using namespace savings::ledger;

constexpr dp::u64 LAMPORTS_PER_SOL = 1000000000;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

std::string formatSol(dp::u64 lamports) {
    std::ostringstream out;
    out << lamports / LAMPORTS_PER_SOL << "." << std::setw(9) << std::setfill('0') << lamports % LAMPORTS_PER_SOL
        << " SOL";
    return out.str();
}

void report(const char *what, const dp::Result<dp::u64, dp::Error> &result) {
    if (result.is_ok()) {
        std::cout << "  " << what << " -> total " << result.value() << " lamports (" << formatSol(result.value())
                  << ")" << std::endl;
    } else {
        std::cout << "  " << what << " -> rejected: " << errorName(result.error().code) << " ("
                  << result.error().message.c_str() << ")" << std::endl;
    }
}

int main() {
    std::cout << "Savings Ledger Demo" << std::endl;

    auto wallet_key = Key::generate();
    auto stranger_key = Key::generate();
    if (!wallet_key.is_ok() || !stranger_key.is_ok()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    KeyIdentityProvider wallet(wallet_key.value());
    KeyIdentityProvider stranger(stranger_key.value());

    LedgerOptions options;
    options.verbose = true;
    Ledger ledger(std::make_shared<storage::MemoryStore>(), options);

    dp::u64 journal_entries = 0;
    ledger.setJournal([&journal_entries](const OperationRecord &) { ++journal_entries; });

    printSeparator("1. Initialize");
    auto account = ledger.initialize(wallet);
    if (!account.is_ok()) {
        std::cerr << "Initialize failed: " << account.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "  Account: " << account.value().toHex() << std::endl;
    std::cout << "  Owner:   " << wallet_key.value().pubkey().toHex() << std::endl;
    report("balance", ledger.getBalance(account.value(), wallet));

    printSeparator("2. Deposits");
    report("deposit 100000000", ledger.deposit(account.value(), wallet, 100000000));
    report("deposit 100000000", ledger.deposit(account.value(), wallet, 100000000));

    printSeparator("3. Withdrawal");
    report("withdraw 100000000", ledger.withdraw(account.value(), wallet, 100000000));
    report("balance", ledger.getBalance(account.value(), wallet));

    printSeparator("4. Rejected operations");
    report("withdraw 200000000", ledger.withdraw(account.value(), wallet, 200000000));
    report("deposit 0", ledger.deposit(account.value(), wallet, 0));
    report("stranger withdraw 1", ledger.withdraw(account.value(), stranger, 1));
    report("stranger balance", ledger.getBalance(account.value(), stranger));

    auto again = ledger.initialize(account.value(), wallet);
    if (!again.is_ok()) {
        std::cout << "  initialize again -> rejected: " << errorName(again.error().code) << std::endl;
    }

    printSeparator("Summary");
    std::cout << "  Accounts:          " << ledger.accountCount() << std::endl;
    std::cout << "  Journal entries:   " << journal_entries << std::endl;
    std::cout << "  Denied by gate:    " << ledger.gate().deniedCount() << std::endl;
    return 0;
}
