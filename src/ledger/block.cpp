#include <minichain/common/digest.hpp>
#include <minichain/common/error.hpp>
#include <minichain/common/serializer.hpp>
#include <minichain/ledger/block.hpp>
#include <minichain/ledger/merkle.hpp>
#include <sstream>

namespace minichain::ledger {

    std::string Block::calculateHash(int64_t height, int64_t timestamp, uint32_t difficulty_bits, uint64_t nonce,
                                     const std::string &merkle_root, const std::string &previous_hash) {
        std::stringstream ss;
        ss << height << '|' << timestamp << '|' << difficulty_bits << '|' << nonce << '|' << merkle_root << '|'
           << previous_hash;
        return sha256Hex(ss.str());
    }

    dp::Result<bool, dp::Error> Block::isValid() const {
        if (height < 0) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Block height is negative"));
        }
        if (previous_hash.empty()) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Block previous hash is empty"));
        }
        if (hash.empty()) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Block hash is empty"));
        }
        if (computeMerkleRoot(transactions) != merkle_root) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Merkle root mismatch"));
        }

        auto calc_hash = calculateHash();
        if (calc_hash.empty()) {
            return dp::Result<bool, dp::Error>::err(hash_failed("Failed to calculate block hash"));
        }
        if (hash != calc_hash) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Block hash mismatch"));
        }
        if (leadingZeroBits(hash) < difficulty_bits) {
            return dp::Result<bool, dp::Error>::err(invalid_block("Block hash misses its difficulty target"));
        }
        return dp::Result<bool, dp::Error>::ok(true);
    }

    dp::Result<bool, dp::Error> Block::verifyTransaction(size_t transaction_index) const {
        if (transaction_index >= transactions.size()) {
            return dp::Result<bool, dp::Error>::err(dp::Error::out_of_range("Transaction index out of range"));
        }
        auto proof = MerkleTree(transactions).proof(transaction_index);
        if (!proof.is_ok())
            return dp::Result<bool, dp::Error>::err(proof.error());
        return dp::Result<bool, dp::Error>::ok(
            MerkleTree::verify(merkle_root, transactions[transaction_index], proof.value()));
    }

    std::string Block::serialize() const {
        std::stringstream ss;
        ss << '{';
        ss << "\"height\": " << height << ", ";
        ss << "\"timestamp\": " << timestamp << ", ";
        ss << "\"difficultyBits\": " << difficulty_bits << ", ";
        ss << "\"nonce\": " << nonce << ", ";
        ss << "\"transactions\": [";
        for (size_t i = 0; i < transactions.size(); ++i) {
            if (i > 0)
                ss << ", ";
            ss << JsonSerializer::quote(transactions[i]);
        }
        ss << "], ";
        ss << "\"prevHash\": \"" << previous_hash << "\", ";
        ss << "\"hash\": \"" << hash << "\", ";
        ss << "\"merkleRoot\": \"" << merkle_root << "\"";
        ss << '}';
        return ss.str();
    }

    dp::Result<Block, dp::Error> Block::deserialize(const std::string &data) {
        try {
            Block block;
            block.height = JsonSerializer::extractInt64(data, "height");
            block.timestamp = JsonSerializer::extractInt64(data, "timestamp");
            block.difficulty_bits = static_cast<uint32_t>(JsonSerializer::extractUint64(data, "difficultyBits"));
            block.nonce = JsonSerializer::extractUint64(data, "nonce");
            block.transactions = JsonSerializer::extractStringArray(data, "transactions");
            block.previous_hash = JsonSerializer::extractString(data, "prevHash");
            block.hash = JsonSerializer::extractString(data, "hash");
            block.merkle_root = JsonSerializer::extractString(data, "merkleRoot");
            return dp::Result<Block, dp::Error>::ok(block);
        } catch (const std::exception &e) {
            return dp::Result<Block, dp::Error>::err(invalid_block(dp::String(e.what())));
        }
    }

} // namespace minichain::ledger
