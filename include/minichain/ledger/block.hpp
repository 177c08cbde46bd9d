#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace minichain::ledger {

    /// A sealed block. Transactions are kept as opaque signed strings.
    struct Block {
        int64_t height = 0;
        int64_t timestamp = 0; // Milliseconds since the Unix epoch
        uint32_t difficulty_bits = 0;
        uint64_t nonce = 0;
        std::vector<std::string> transactions;
        std::string previous_hash;
        std::string hash;
        std::string merkle_root;

        /// Hex SHA-256 over the header fields; the merkle root commits to the transactions
        static std::string calculateHash(int64_t height, int64_t timestamp, uint32_t difficulty_bits, uint64_t nonce,
                                         const std::string &merkle_root, const std::string &previous_hash);

        std::string calculateHash() const {
            return calculateHash(height, timestamp, difficulty_bits, nonce, merkle_root, previous_hash);
        }

        /// Recompute merkle root and hash and check the difficulty target
        dp::Result<bool, dp::Error> isValid() const;

        /// Merkle inclusion check for one transaction
        dp::Result<bool, dp::Error> verifyTransaction(size_t transaction_index) const;

        /// One JSON line
        std::string serialize() const;
        static dp::Result<Block, dp::Error> deserialize(const std::string &data);

        bool operator==(const Block &other) const {
            return height == other.height && timestamp == other.timestamp &&
                   difficulty_bits == other.difficulty_bits && nonce == other.nonce &&
                   transactions == other.transactions && previous_hash == other.previous_hash &&
                   hash == other.hash && merkle_root == other.merkle_root;
        }
        bool operator!=(const Block &other) const { return !(*this == other); }
    };

} // namespace minichain::ledger
