#include <chrono>
#include <iostream>
#include <minichain/common/digest.hpp>
#include <minichain/common/error.hpp>
#include <minichain/ledger/chain.hpp>
#include <minichain/ledger/merkle.hpp>
#include <minichain/ledger/transaction.hpp>

namespace minichain::ledger {

    using namespace std::chrono;

    ChainStore::ChainStore(identity::IdentityVault &vault, std::shared_ptr<Sealer> sealer, const Options &options)
        : vault_(vault), sealer_(std::move(sealer)), options_(options) {}

    dp::Result<Block, dp::Error> ChainStore::sealBlock(int64_t height, const std::string &previous_hash,
                                                       const std::vector<std::string> &transactions) const {
        if (!sealer_)
            return dp::Result<Block, dp::Error>::err(seal_failed("No sealer configured"));

        Block block;
        block.height = height;
        block.timestamp = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        block.difficulty_bits = options_.difficulty_bits;
        block.transactions = transactions;
        block.previous_hash = previous_hash;
        block.merkle_root = computeMerkleRoot(transactions);

        SealRequest request;
        request.height = block.height;
        request.timestamp = block.timestamp;
        request.difficulty_bits = block.difficulty_bits;
        request.transactions = block.transactions;
        request.merkle_root = block.merkle_root;
        request.previous_hash = block.previous_hash;

        auto sealed = sealer_->seal(request);
        if (!sealed.is_ok())
            return dp::Result<Block, dp::Error>::err(sealed.error());

        block.hash = sealed.value().hash;
        block.nonce = sealed.value().nonce;
        std::cout << "Sealed block #" << block.height << " (" << block.transactions.size()
                  << " transactions, nonce " << block.nonce << ")" << std::endl;
        return dp::Result<Block, dp::Error>::ok(block);
    }

    dp::Result<Block, dp::Error> ChainStore::genesis(const std::string &miner_name) {
        if (!blocks_.empty())
            return dp::Result<Block, dp::Error>::err(genesis_exists());

        auto signature = vault_.sign(miner_name, genesisPayload());
        if (!signature.is_ok())
            return dp::Result<Block, dp::Error>::err(signature.error());

        SignedMessage message{genesisPayload(), signature.value()};
        auto block = sealBlock(0, zeroDigestHex(), {message.toString()});
        if (!block.is_ok())
            return block;

        blocks_.push_back(block.value());
        return block;
    }

    dp::Result<Block, dp::Error> ChainStore::append(const std::vector<std::string> &transactions,
                                                    const std::string &miner_name) {
        if (!vault_.hasAccount(miner_name))
            return dp::Result<Block, dp::Error>::err(unknown_account(errorText("Unknown miner: " + miner_name)));

        auto block = assemble(transactions);
        if (!block.is_ok())
            return block;

        auto committed = commit(block.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());
        return block;
    }

    dp::Result<Block, dp::Error> ChainStore::assemble(const std::vector<std::string> &transactions) const {
        auto current = tip();
        if (!current.is_ok())
            return current;
        return sealBlock(current.value().height + 1, current.value().hash, transactions);
    }

    dp::Result<void, dp::Error> ChainStore::commit(const Block &block) {
        if (blocks_.empty()) {
            if (block.height != 0 || block.previous_hash != zeroDigestHex())
                return dp::Result<void, dp::Error>::err(invalid_block("First block must be a genesis block"));
        } else {
            const Block &last = blocks_.back();
            if (block.height != last.height + 1)
                return dp::Result<void, dp::Error>::err(invalid_block("Block height does not follow the tip"));
            if (block.previous_hash != last.hash)
                return dp::Result<void, dp::Error>::err(invalid_block("Block does not link to the tip"));
        }
        blocks_.push_back(block);
        return dp::Result<void, dp::Error>::ok();
    }

    bool ChainStore::verifyLink(const Block &block_a, const Block &block_b) {
        return computeMerkleRoot(block_a.transactions) == computeMerkleRoot(block_b.transactions);
    }

    dp::Result<bool, dp::Error> ChainStore::verifyChain() const {
        if (blocks_.empty())
            return dp::Result<bool, dp::Error>::err(empty_chain());

        for (size_t i = 0; i < blocks_.size(); i++) {
            const Block &current = blocks_[i];
            if (current.height != static_cast<int64_t>(i))
                return dp::Result<bool, dp::Error>::err(
                    invalid_block(errorText("Unexpected height at position " + std::to_string(i))));

            const std::string expected_parent = (i == 0) ? zeroDigestHex() : blocks_[i - 1].hash;
            if (current.previous_hash != expected_parent)
                return dp::Result<bool, dp::Error>::err(
                    invalid_block(errorText("Broken parent link at height " + std::to_string(i))));

            auto valid = current.isValid();
            if (!valid.is_ok())
                return valid;
        }
        return dp::Result<bool, dp::Error>::ok(true);
    }

    dp::Result<Block, dp::Error> ChainStore::tip() const {
        if (blocks_.empty())
            return dp::Result<Block, dp::Error>::err(empty_chain());
        return dp::Result<Block, dp::Error>::ok(blocks_.back());
    }

    dp::Result<void, dp::Error> ChainStore::restore(std::vector<Block> blocks) {
        std::vector<Block> previous = std::move(blocks_);
        blocks_.clear();
        for (const auto &block : blocks) {
            auto committed = commit(block);
            if (!committed.is_ok()) {
                blocks_ = std::move(previous);
                return committed;
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace minichain::ledger
