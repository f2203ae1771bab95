#include <iostream>
#include <savings/ledger/auth.hpp>

namespace savings::ledger {

    AuthorizationGate::AuthorizationGate(bool verbose) : verbose_(verbose) {}

    bool AuthorizationGate::isOwner(const Account &account, const Identity &caller) const {
        return !caller.isZero() && account.owner == caller;
    }

    dp::Result<void, dp::Error> AuthorizationGate::authorize(const Account &account, const Identity &caller) const {
        if (!isOwner(account, caller)) {
            denied_.fetch_add(1, std::memory_order_relaxed);
            if (verbose_) {
                std::cerr << "Unauthorized caller " << caller.shortHex() << " for account owned by "
                          << account.owner.shortHex() << std::endl;
            }
            return dp::Result<void, dp::Error>::err(unauthorized());
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> AuthorizationGate::authorizeRead(const Account &account, const Identity &caller,
                                                                 bool public_read) const {
        if (public_read) {
            return dp::Result<void, dp::Error>::ok();
        }
        return authorize(account, caller);
    }

    dp::Result<void, dp::Error> AuthorizationGate::checkUninitialized(const storage::AccountStore &accounts,
                                                                      const Address &address) const {
        if (accounts.exists(address)) {
            if (verbose_) {
                std::cerr << "Account " << address.shortHex() << " is already initialized" << std::endl;
            }
            return dp::Result<void, dp::Error>::err(
                already_initialized(dp::String(("Account " + address.toHex() + " already initialized").c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::u64 AuthorizationGate::deniedCount() const { return denied_.load(std::memory_order_relaxed); }

} // namespace savings::ledger
