#pragma once

#include <memory>

#include "record_store.hpp"
#include "savings/ledger/account.hpp"

namespace savings::storage {

    /// Typed view of deposit accounts on top of a record substrate.
    /// Owns the record layout; durability and atomicity belong to the substrate.
    class AccountStore {
      public:
        inline explicit AccountStore(std::shared_ptr<IRecordStore> records) : records_(std::move(records)) {}

        /// Allocate a new account at address owned by owner with a zero total
        inline Result<ledger::Account, Error> create(const ledger::Address &address, const ledger::Identity &owner) {
            ledger::Account account(owner);
            auto allocated = records_->allocate(address.toHex(), account.encode());
            if (!allocated.is_ok()) {
                return Result<ledger::Account, Error>::err(allocated.error());
            }
            return Result<ledger::Account, Error>::ok(account);
        }

        inline Result<ledger::Account, Error> load(const ledger::Address &address) const {
            auto bytes = records_->read(address.toHex());
            if (!bytes.is_ok()) {
                return Result<ledger::Account, Error>::err(bytes.error());
            }
            return ledger::Account::decode(bytes.value());
        }

        inline Result<void, Error> store(const ledger::Address &address, const ledger::Account &account) {
            return records_->write(address.toHex(), account.encode());
        }

        inline bool exists(const ledger::Address &address) const { return records_->contains(address.toHex()); }

        inline u64 size() const { return records_->count(); }

        inline IRecordStore &records() { return *records_; }

      private:
        std::shared_ptr<IRecordStore> records_;
    };

} // namespace savings::storage
