#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

#include "account.hpp"
#include "pubkey.hpp"
#include "savings/storage/account_store.hpp"

namespace savings::ledger {

    /// Single owner check shared by every ledger operation.
    /// All identity comparisons in the ledger go through this class.
    class AuthorizationGate {
      public:
        AuthorizationGate() = default;
        explicit AuthorizationGate(bool verbose);

        /// Mutations and owner-only reads: caller must be the recorded owner
        dp::Result<void, dp::Error> authorize(const Account &account, const Identity &caller) const;

        /// Balance reads; public_read skips the owner check
        dp::Result<void, dp::Error> authorizeRead(const Account &account, const Identity &caller,
                                                  bool public_read) const;

        /// Initialize-side check: nobody owns the address yet
        dp::Result<void, dp::Error> checkUninitialized(const storage::AccountStore &accounts,
                                                       const Address &address) const;

        bool isOwner(const Account &account, const Identity &caller) const;

        /// Number of rejected authorization checks since construction
        dp::u64 deniedCount() const;

      private:
        bool verbose_ = false;
        mutable std::atomic<dp::u64> denied_{0};
    };

} // namespace savings::ledger
