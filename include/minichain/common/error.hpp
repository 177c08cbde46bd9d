#pragma once

#include <datapod/datapod.hpp>

namespace minichain {

    // ===========================================
    // Minichain-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_DUPLICATE_ACCOUNT = 100;
    constexpr dp::u32 ERR_UNKNOWN_ACCOUNT = 101;
    constexpr dp::u32 ERR_INSUFFICIENT_BALANCE = 102;
    constexpr dp::u32 ERR_SETTLEMENT_INSUFFICIENT_BALANCE = 103;
    constexpr dp::u32 ERR_SIGNATURE_INVALID = 104;
    constexpr dp::u32 ERR_SETTLEMENT_INCONSISTENCY = 105;
    constexpr dp::u32 ERR_EMPTY_CHAIN = 106;
    constexpr dp::u32 ERR_GENESIS_EXISTS = 107;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 108;
    constexpr dp::u32 ERR_INVALID_BLOCK = 109;
    constexpr dp::u32 ERR_SEAL_FAILED = 110;
    constexpr dp::u32 ERR_HASH_FAILED = 111;
    constexpr dp::u32 ERR_CORRUPT_OR_MISSING_STORE = 112;
    constexpr dp::u32 ERR_CORRUPT_SEGMENT = 113;
    constexpr dp::u32 ERR_NOT_INITIALIZED = 114;
    constexpr dp::u32 ERR_ALREADY_INITIALIZED = 115;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error duplicate_account(const dp::String &msg = "Account already exists") {
        return dp::Error{ERR_DUPLICATE_ACCOUNT, msg};
    }

    inline dp::Error unknown_account(const dp::String &msg = "Unknown account") {
        return dp::Error{ERR_UNKNOWN_ACCOUNT, msg};
    }

    inline dp::Error insufficient_balance(const dp::String &msg = "Insufficient balance") {
        return dp::Error{ERR_INSUFFICIENT_BALANCE, msg};
    }

    /// Raised by settlement when a transfer accepted at enqueue time no longer fits the balances
    inline dp::Error settlement_insufficient_balance(const dp::String &msg = "Insufficient balance at settlement") {
        return dp::Error{ERR_SETTLEMENT_INSUFFICIENT_BALANCE, msg};
    }

    inline dp::Error signature_invalid(const dp::String &msg = "Signature verification failed") {
        return dp::Error{ERR_SIGNATURE_INVALID, msg};
    }

    /// The block is committed but part of the post-commit bookkeeping did not become durable
    inline dp::Error settlement_inconsistency(const dp::String &msg = "Settlement partially recorded") {
        return dp::Error{ERR_SETTLEMENT_INCONSISTENCY, msg};
    }

    inline dp::Error empty_chain(const dp::String &msg = "Chain is empty") { return dp::Error{ERR_EMPTY_CHAIN, msg}; }

    inline dp::Error genesis_exists(const dp::String &msg = "Chain already has a genesis block") {
        return dp::Error{ERR_GENESIS_EXISTS, msg};
    }

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be positive") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error invalid_block(const dp::String &msg = "Invalid block") {
        return dp::Error{ERR_INVALID_BLOCK, msg};
    }

    inline dp::Error seal_failed(const dp::String &msg = "Block sealing failed") {
        return dp::Error{ERR_SEAL_FAILED, msg};
    }

    inline dp::Error hash_failed(const dp::String &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, msg};
    }

    inline dp::Error corrupt_or_missing_store(const dp::String &msg = "Store is corrupt or missing") {
        return dp::Error{ERR_CORRUPT_OR_MISSING_STORE, msg};
    }

    inline dp::Error corrupt_segment(const dp::String &msg = "Corrupt segment record") {
        return dp::Error{ERR_CORRUPT_SEGMENT, msg};
    }

    inline dp::Error not_initialized(const dp::String &msg = "Not initialized") {
        return dp::Error{ERR_NOT_INITIALIZED, msg};
    }

    inline dp::Error already_initialized(const dp::String &msg = "Already initialized") {
        return dp::Error{ERR_ALREADY_INITIALIZED, msg};
    }

    /// Prefix a std::string onto an error message (datapod strings are built from C strings)
    inline dp::String errorText(const std::string &text) { return dp::String(text.c_str()); }

} // namespace minichain
