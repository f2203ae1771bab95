#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <functional>
#include <keylock/keylock.hpp>
#include <string>
#include <tuple>
#include <vector>

#include "pubkey.hpp"

namespace savings::ledger {

    /// Committed operation kinds
    enum class OperationType : dp::u8 {
        Initialize = 0,
        Deposit = 1,
        Withdraw = 2,
    };

    inline std::string operationTypeToString(OperationType type) {
        switch (type) {
        case OperationType::Initialize:
            return "initialize";
        case OperationType::Deposit:
            return "deposit";
        case OperationType::Withdraw:
            return "withdraw";
        default:
            return "unknown";
        }
    }

    /// Journal entry emitted after a mutation is durably committed
    struct OperationRecord {
        dp::u8 operation_type{0}; // OperationType
        dp::String address;       // Account address (hex)
        dp::String caller;        // Caller identity (hex)
        dp::u64 amount{0};
        dp::u64 total_after{0};
        dp::i64 timestamp{0}; // Milliseconds since epoch

        OperationRecord() = default;

        OperationRecord(OperationType type, const Address &account, const Identity &who, dp::u64 value,
                        dp::u64 total)
            : operation_type(static_cast<dp::u8>(type)), address(dp::String(account.toHex().c_str())),
              caller(dp::String(who.toHex().c_str())), amount(value), total_after(total),
              timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count()) {}

        inline OperationType getOperationType() const { return static_cast<OperationType>(operation_type); }

        inline std::string getAddress() const { return std::string(address.c_str()); }

        inline std::string getCaller() const { return std::string(caller.c_str()); }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<OperationRecord &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<OperationRecord, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, OperationRecord>(buf);
                return dp::Result<OperationRecord, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<OperationRecord, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        /// SHA-256 of the serialized record, hex encoded
        inline std::string signature() const {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(toBytes());
            if (!hash_result.success) {
                return "";
            }
            return keylock::keylock::to_hex(hash_result.data);
        }

        auto members() { return std::tie(operation_type, address, caller, amount, total_after, timestamp); }
        auto members() const { return std::tie(operation_type, address, caller, amount, total_after, timestamp); }
    };

    /// Receives one record per committed mutation
    using OperationSink = std::function<void(const OperationRecord &)>;

} // namespace savings::ledger
