#pragma once

#include <datapod/datapod.hpp>

namespace savings {

    // ===========================================
    // Savings-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_ALREADY_INITIALIZED = 100;
    constexpr dp::u32 ERR_ACCOUNT_NOT_FOUND = 101;
    constexpr dp::u32 ERR_CORRUPT_RECORD = 102;
    constexpr dp::u32 ERR_UNAUTHORIZED = 103;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 104;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 105;
    constexpr dp::u32 ERR_ARITHMETIC_OVERFLOW = 106;
    constexpr dp::u32 ERR_STORAGE_FAILURE = 107;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error already_initialized(const dp::String &msg = "Account already initialized") {
        return dp::Error{ERR_ALREADY_INITIALIZED, msg};
    }

    inline dp::Error account_not_found(const dp::String &msg = "Account not found") {
        return dp::Error{ERR_ACCOUNT_NOT_FOUND, msg};
    }

    inline dp::Error corrupt_record(const dp::String &msg = "Account record is corrupt") {
        return dp::Error{ERR_CORRUPT_RECORD, msg};
    }

    inline dp::Error unauthorized(const dp::String &msg = "Caller is not the account owner") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be greater than zero") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error arithmetic_overflow(const dp::String &msg = "Deposit would overflow the account total") {
        return dp::Error{ERR_ARITHMETIC_OVERFLOW, msg};
    }

    inline dp::Error storage_failure(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILURE, msg};
    }

    /// True when the error carries the given savings error code
    inline bool isError(const dp::Error &error, dp::u32 code) { return error.code == code; }

    /// Human readable name of a savings error code
    inline const char *errorName(dp::u32 code) {
        switch (code) {
        case ERR_ALREADY_INITIALIZED:
            return "AlreadyInitialized";
        case ERR_ACCOUNT_NOT_FOUND:
            return "NotFound";
        case ERR_CORRUPT_RECORD:
            return "CorruptRecord";
        case ERR_UNAUTHORIZED:
            return "Unauthorized";
        case ERR_INVALID_AMOUNT:
            return "InvalidAmount";
        case ERR_INSUFFICIENT_FUNDS:
            return "InsufficientFunds";
        case ERR_ARITHMETIC_OVERFLOW:
            return "ArithmeticOverflow";
        case ERR_STORAGE_FAILURE:
            return "StorageFailure";
        default:
            return "Unknown";
        }
    }

} // namespace savings
