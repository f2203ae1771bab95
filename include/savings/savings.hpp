#pragma once

// High-level savings facade
// Composes ledger and storage modules

#include "savings/common/error.hpp"
#include "savings/ledger/account.hpp"
#include "savings/ledger/auth.hpp"
#include "savings/ledger/identity_provider.hpp"
#include "savings/ledger/key.hpp"
#include "savings/ledger/ledger.hpp"
#include "savings/ledger/operation.hpp"
#include "savings/ledger/pubkey.hpp"
#include "savings/storage/account_store.hpp"
#include "savings/storage/file_store.hpp"
#include "savings/storage/memory_store.hpp"
#include "savings/storage/record_store.hpp"
#include "savings/storage/sqlite_store.hpp"
