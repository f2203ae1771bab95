#include <iostream>
#include <limits>
#include <savings/ledger/ledger.hpp>

namespace savings::ledger {

    Ledger::Ledger(std::shared_ptr<storage::IRecordStore> records, LedgerOptions options)
        : options_(options), accounts_(std::move(records)), gate_(options.verbose) {}

    // ===========================================
    // Initialize
    // ===========================================

    dp::Result<Address, dp::Error> Ledger::initialize(const Address &address, const Identity &caller) {
        if (address.isZero()) {
            return dp::Result<Address, dp::Error>::err(dp::Error::invalid_argument("Account address is empty"));
        }
        if (caller.isZero()) {
            return dp::Result<Address, dp::Error>::err(unauthorized("Caller identity is empty"));
        }

        {
            std::lock_guard lock(accountMutex(address));

            auto fresh = gate_.checkUninitialized(accounts_, address);
            if (!fresh.is_ok()) {
                return dp::Result<Address, dp::Error>::err(fresh.error());
            }

            // allocate() rejects a concurrent creator from another process as well
            auto created = accounts_.create(address, caller);
            if (!created.is_ok()) {
                return dp::Result<Address, dp::Error>::err(created.error());
            }
        }

        commit(OperationRecord(OperationType::Initialize, address, caller, 0, 0));
        return dp::Result<Address, dp::Error>::ok(address);
    }

    dp::Result<Address, dp::Error> Ledger::initialize(const Identity &caller) {
        auto key = Key::generate();
        if (!key.is_ok()) {
            return dp::Result<Address, dp::Error>::err(key.error());
        }
        return initialize(key.value().pubkey(), caller);
    }

    // ===========================================
    // Deposit / Withdraw
    // ===========================================

    dp::Result<dp::u64, dp::Error> Ledger::deposit(const Address &address, const Identity &caller, dp::u64 amount) {
        if (amount == 0) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_amount("Deposit amount must be greater than zero"));
        }

        Account account;
        {
            std::lock_guard lock(accountMutex(address));

            auto loaded = accounts_.load(address);
            if (!loaded.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(loaded.error());
            }
            account = loaded.value();

            auto allowed = gate_.authorize(account, caller);
            if (!allowed.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(allowed.error());
            }

            if (amount > std::numeric_limits<dp::u64>::max() - account.total_deposits) {
                return dp::Result<dp::u64, dp::Error>::err(arithmetic_overflow());
            }
            account.total_deposits += amount;

            auto stored = accounts_.store(address, account);
            if (!stored.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(stored.error());
            }
        }

        commit(OperationRecord(OperationType::Deposit, address, caller, amount, account.total_deposits));
        return dp::Result<dp::u64, dp::Error>::ok(account.total_deposits);
    }

    dp::Result<dp::u64, dp::Error> Ledger::withdraw(const Address &address, const Identity &caller, dp::u64 amount) {
        if (amount == 0) {
            return dp::Result<dp::u64, dp::Error>::err(invalid_amount("Withdrawal amount must be greater than zero"));
        }

        Account account;
        {
            std::lock_guard lock(accountMutex(address));

            auto loaded = accounts_.load(address);
            if (!loaded.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(loaded.error());
            }
            account = loaded.value();

            auto allowed = gate_.authorize(account, caller);
            if (!allowed.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(allowed.error());
            }

            if (amount > account.total_deposits) {
                return dp::Result<dp::u64, dp::Error>::err(insufficient_funds(dp::String(
                    ("Withdrawal of " + std::to_string(amount) + " exceeds balance " +
                     std::to_string(account.total_deposits))
                        .c_str())));
            }
            account.total_deposits -= amount;

            auto stored = accounts_.store(address, account);
            if (!stored.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(stored.error());
            }
        }

        commit(OperationRecord(OperationType::Withdraw, address, caller, amount, account.total_deposits));
        return dp::Result<dp::u64, dp::Error>::ok(account.total_deposits);
    }

    // ===========================================
    // GetBalance
    // ===========================================

    dp::Result<dp::u64, dp::Error> Ledger::getBalance(const Address &address, const Identity &caller) const {
        std::lock_guard lock(accountMutex(address));

        auto loaded = accounts_.load(address);
        if (!loaded.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(loaded.error());
        }

        auto allowed = gate_.authorizeRead(loaded.value(), caller, options_.public_balance);
        if (!allowed.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(allowed.error());
        }

        return dp::Result<dp::u64, dp::Error>::ok(loaded.value().total_deposits);
    }

    // ===========================================
    // Identity provider overloads
    // ===========================================
    // Any provider failure is reported as ERR_UNAUTHORIZED

    dp::Result<Address, dp::Error> Ledger::initialize(const Address &address, const IIdentityProvider &caller) {
        auto who = caller.currentCaller();
        if (!who.is_ok()) {
            return dp::Result<Address, dp::Error>::err(unauthorized(who.error().message));
        }
        return initialize(address, who.value());
    }

    dp::Result<Address, dp::Error> Ledger::initialize(const IIdentityProvider &caller) {
        auto who = caller.currentCaller();
        if (!who.is_ok()) {
            return dp::Result<Address, dp::Error>::err(unauthorized(who.error().message));
        }
        return initialize(who.value());
    }

    dp::Result<dp::u64, dp::Error> Ledger::deposit(const Address &address, const IIdentityProvider &caller,
                                                   dp::u64 amount) {
        auto who = caller.currentCaller();
        if (!who.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(unauthorized(who.error().message));
        }
        return deposit(address, who.value(), amount);
    }

    dp::Result<dp::u64, dp::Error> Ledger::withdraw(const Address &address, const IIdentityProvider &caller,
                                                    dp::u64 amount) {
        auto who = caller.currentCaller();
        if (!who.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(unauthorized(who.error().message));
        }
        return withdraw(address, who.value(), amount);
    }

    dp::Result<dp::u64, dp::Error> Ledger::getBalance(const Address &address,
                                                      const IIdentityProvider &caller) const {
        auto who = caller.currentCaller();
        if (!who.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(unauthorized(who.error().message));
        }
        return getBalance(address, who.value());
    }

    // ===========================================
    // Misc
    // ===========================================

    void Ledger::setJournal(OperationSink sink) { journal_ = std::move(sink); }

    bool Ledger::exists(const Address &address) const { return accounts_.exists(address); }

    dp::u64 Ledger::accountCount() const { return accounts_.size(); }

    std::mutex &Ledger::accountMutex(const Address &address) const {
        return account_locks_[std::hash<Address>{}(address) % ACCOUNT_LOCK_STRIPES];
    }

    void Ledger::commit(const OperationRecord &record) const {
        if (options_.verbose) {
            std::cout << "[" << operationTypeToString(record.getOperationType()) << "] account "
                      << record.getAddress().substr(0, 8) << " by " << record.getCaller().substr(0, 8)
                      << " amount=" << record.amount << " total=" << record.total_after
                      << " signature=" << record.signature() << std::endl;
        }
        if (journal_) {
            journal_(record);
        }
    }

} // namespace savings::ledger
