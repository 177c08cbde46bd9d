#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace minichain::ledger {

    /// A text payload with its detached signature, as stored inside blocks: "<payload>|<base58 signature>"
    struct SignedMessage {
        std::string payload;
        std::vector<uint8_t> signature;

        std::string toString() const;
        static dp::Result<SignedMessage, dp::Error> parse(const std::string &text);
    };

    /// A signed transfer between two accounts. It carries both the signed payload and the
    /// transfer intent, so the pending pool is a single sequence of these records.
    struct SignedTransaction {
        std::string source;
        std::string dest;
        uint64_t amount = 0;
        std::vector<uint8_t> signature;

        /// Canonical signed text: "from: <source> -- to: <dest> -- amount: <amount>"
        static std::string transferPayload(const std::string &source, const std::string &dest, uint64_t amount);

        std::string payload() const { return transferPayload(source, dest, amount); }
        SignedMessage message() const { return SignedMessage{payload(), signature}; }
        std::string toString() const { return message().toString(); }

        /// Journal line: {"source", "dest", "amount", "signature" (base58, omitted when unsigned)}
        std::string serialize() const;
        static dp::Result<SignedTransaction, dp::Error> deserialize(const std::string &data);

        bool operator==(const SignedTransaction &other) const {
            return source == other.source && dest == other.dest && amount == other.amount &&
                   signature == other.signature;
        }
        bool operator!=(const SignedTransaction &other) const { return !(*this == other); }
    };

    /// Reward message signed by the miner and appended to every settled block
    std::string coinbasePayload(uint64_t subsidy, const std::string &miner);

    /// Miner named by a coinbase payload for the given subsidy
    std::optional<std::string> coinbaseMiner(const std::string &payload, uint64_t subsidy);

    /// Message signed by the first miner and sealed into block 0
    std::string genesisPayload();

} // namespace minichain::ledger
