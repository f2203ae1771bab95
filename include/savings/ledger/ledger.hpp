#pragma once

#include <array>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <tuple>

#include "account.hpp"
#include "auth.hpp"
#include "identity_provider.hpp"
#include "key.hpp"
#include "operation.hpp"
#include "pubkey.hpp"
#include "savings/common/error.hpp"
#include "savings/storage/account_store.hpp"
#include "savings/storage/record_store.hpp"

namespace savings::ledger {

    struct LedgerOptions {
        bool verbose = false;        // Log every committed operation to stdout
        bool public_balance = false; // Let any identity read balances

        auto members() { return std::tie(verbose, public_balance); }
        auto members() const { return std::tie(verbose, public_balance); }
    };

    /// Deposit ledger: Initialize, Deposit, Withdraw and GetBalance over one
    /// account record per address.
    ///
    /// Operations on the same address are serialized by a striped mutex picked
    /// from the address hash; most operations on different addresses run in
    /// parallel. Every operation either commits a consistent post-state or leaves
    /// the record untouched. The journal sink runs after the lock is released.
    class Ledger {
      public:
        explicit Ledger(std::shared_ptr<storage::IRecordStore> records, LedgerOptions options = LedgerOptions{});

        Ledger(const Ledger &) = delete;
        Ledger &operator=(const Ledger &) = delete;

        /// Create an account at address owned by caller with a zero total.
        /// A second call for the same address fails with ERR_ALREADY_INITIALIZED.
        dp::Result<Address, dp::Error> initialize(const Address &address, const Identity &caller);

        /// Create an account at a freshly generated address
        dp::Result<Address, dp::Error> initialize(const Identity &caller);

        /// Add amount to the account total; returns the new total
        dp::Result<dp::u64, dp::Error> deposit(const Address &address, const Identity &caller, dp::u64 amount);

        /// Remove amount from the account total; returns the new total
        dp::Result<dp::u64, dp::Error> withdraw(const Address &address, const Identity &caller, dp::u64 amount);

        /// Current account total, no side effects
        dp::Result<dp::u64, dp::Error> getBalance(const Address &address, const Identity &caller) const;

        // Same operations with the caller resolved through an identity provider
        dp::Result<Address, dp::Error> initialize(const Address &address, const IIdentityProvider &caller);
        dp::Result<Address, dp::Error> initialize(const IIdentityProvider &caller);
        dp::Result<dp::u64, dp::Error> deposit(const Address &address, const IIdentityProvider &caller,
                                               dp::u64 amount);
        dp::Result<dp::u64, dp::Error> withdraw(const Address &address, const IIdentityProvider &caller,
                                                dp::u64 amount);
        dp::Result<dp::u64, dp::Error> getBalance(const Address &address, const IIdentityProvider &caller) const;

        /// Install the journal sink. Not synchronized with running operations.
        void setJournal(OperationSink sink);

        bool exists(const Address &address) const;

        dp::u64 accountCount() const;

        const LedgerOptions &options() const { return options_; }

        const AuthorizationGate &gate() const { return gate_; }

      private:
        std::mutex &accountMutex(const Address &address) const;
        void commit(const OperationRecord &record) const;

        LedgerOptions options_;
        storage::AccountStore accounts_;
        AuthorizationGate gate_;
        OperationSink journal_;

        static constexpr dp::usize ACCOUNT_LOCK_STRIPES = 64;
        mutable std::array<std::mutex, ACCOUNT_LOCK_STRIPES> account_locks_;
    };

} // namespace savings::ledger
