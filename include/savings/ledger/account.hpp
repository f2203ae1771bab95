#pragma once

#include <array>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "pubkey.hpp"
#include "serializer.hpp"
#include "savings/common/error.hpp"

namespace savings::ledger {

    /// Record tag at the head of every account record ("SAVDEP01")
    constexpr std::array<dp::u8, 8> ACCOUNT_DISCRIMINATOR = {'S', 'A', 'V', 'D', 'E', 'P', '0', '1'};

    /// Exact persisted size: discriminator + owner + total
    constexpr dp::usize ACCOUNT_SIZE = ACCOUNT_DISCRIMINATOR.size() + Pubkey::SIZE + sizeof(dp::u64);

    /// One deposit account.
    ///
    /// Layout (little-endian, 48 bytes):
    ///   [0, 8)   discriminator
    ///   [8, 40)  owner identity
    ///   [40, 48) total deposits
    struct Account {
        Identity owner;
        dp::u64 total_deposits = 0;

        Account() = default;
        explicit Account(const Identity &owner_identity) : owner(owner_identity), total_deposits(0) {}

        inline std::vector<uint8_t> encode() const {
            std::vector<uint8_t> buffer;
            buffer.reserve(ACCOUNT_SIZE);
            BinarySerializer::writeFixed(buffer, ACCOUNT_DISCRIMINATOR);
            BinarySerializer::writeFixed(buffer, owner.bytes());
            BinarySerializer::writeUint64(buffer, total_deposits);
            return buffer;
        }

        inline static dp::Result<Account, dp::Error> decode(const std::vector<uint8_t> &data) {
            if (data.size() != ACCOUNT_SIZE) {
                return dp::Result<Account, dp::Error>::err(corrupt_record(dp::String(
                    ("Account record has " + std::to_string(data.size()) + " bytes, expected " +
                     std::to_string(ACCOUNT_SIZE))
                        .c_str())));
            }

            try {
                size_t offset = 0;
                auto tag = BinarySerializer::readFixed<ACCOUNT_DISCRIMINATOR.size()>(data, offset);
                if (tag != ACCOUNT_DISCRIMINATOR) {
                    return dp::Result<Account, dp::Error>::err(corrupt_record("Account record has unknown tag"));
                }

                Account account;
                account.owner = Identity(BinarySerializer::readFixed<Pubkey::SIZE>(data, offset));
                account.total_deposits = BinarySerializer::readUint64(data, offset);
                return dp::Result<Account, dp::Error>::ok(account);
            } catch (const std::exception &e) {
                return dp::Result<Account, dp::Error>::err(corrupt_record(dp::String(e.what())));
            }
        }

        inline bool operator==(const Account &other) const {
            return owner == other.owner && total_deposits == other.total_deposits;
        }
    };

} // namespace savings::ledger
