#include <iostream>
#include <map>
#include <minichain/common/error.hpp>
#include <minichain/ledger/pool.hpp>
#include <minichain/storage/segment_store.hpp>

namespace minichain::ledger {

    LedgerPool::LedgerPool(identity::IdentityVault &vault, ChainStore &chain,
                           std::shared_ptr<storage::SegmentStore> store, const Options &options)
        : vault_(vault), chain_(chain), store_(std::move(store)), options_(options) {}

    uint64_t LedgerPool::pendingOutgoing(const std::string &name) const {
        uint64_t total = 0;
        for (const auto &tx : pending_) {
            if (tx.source == name)
                total += tx.amount;
        }
        return total;
    }

    dp::Result<void, dp::Error> LedgerPool::journal() {
        if (!store_)
            return dp::Result<void, dp::Error>::ok();
        if (!uncommitted_)
            return store_->rewritePending(pending_);

        // The last block's balances are still owed to disk; commit them together with the journal
        auto committed = store_->commitSettlement(vault_.accounts(), pending_);
        if (committed.is_ok())
            uncommitted_ = false;
        return committed;
    }

    dp::Result<void, dp::Error> LedgerPool::dryRun(const std::vector<SignedTransaction> &records,
                                                   const std::string &miner_name) const {
        auto snapshot = vault_.balanceSnapshot();
        snapshot[miner_name] += options_.subsidy;
        for (const auto &tx : records) {
            auto from = snapshot.find(tx.source);
            auto to = snapshot.find(tx.dest);
            if (from == snapshot.end() || to == snapshot.end())
                return dp::Result<void, dp::Error>::err(
                    unknown_account(errorText("Unknown account in pending transfer: " + tx.payload())));
            if (from->second < tx.amount)
                return dp::Result<void, dp::Error>::err(settlement_insufficient_balance(
                    errorText(tx.source + " has no enough balance for transaction: " + tx.payload())));
            from->second -= tx.amount;
            to->second += tx.amount;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerPool::apply(const std::vector<SignedTransaction> &records,
                                                  const std::string &miner_name) {
        auto credited = vault_.credit(miner_name, options_.subsidy);
        if (!credited.is_ok())
            return credited;
        for (const auto &tx : records) {
            auto moved = vault_.moveBalance(tx.source, tx.dest, tx.amount);
            if (!moved.is_ok())
                return moved;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<SignedTransaction, dp::Error> LedgerPool::addTransaction(const std::string &source,
                                                                        const std::string &dest, uint64_t amount) {
        if (amount == 0)
            return dp::Result<SignedTransaction, dp::Error>::err(invalid_amount());
        if (!vault_.hasAccount(source))
            return dp::Result<SignedTransaction, dp::Error>::err(
                unknown_account(errorText("Unknown account: " + source)));
        if (!vault_.hasAccount(dest))
            return dp::Result<SignedTransaction, dp::Error>::err(unknown_account(errorText("Unknown account: " + dest)));

        // Transfers already queued from the same source are spent against the same balance
        auto balance = vault_.balance(source);
        if (!balance.is_ok())
            return dp::Result<SignedTransaction, dp::Error>::err(balance.error());
        const uint64_t outgoing = pendingOutgoing(source);
        if (outgoing > balance.value() || balance.value() - outgoing < amount)
            return dp::Result<SignedTransaction, dp::Error>::err(
                insufficient_balance(errorText(source + " has no enough balance for transaction")));

        SignedTransaction tx;
        tx.source = source;
        tx.dest = dest;
        tx.amount = amount;
        auto signature = vault_.sign(source, tx.payload());
        if (!signature.is_ok())
            return dp::Result<SignedTransaction, dp::Error>::err(signature.error());
        tx.signature = signature.value();

        pending_.push_back(tx);
        auto written = journal();
        if (!written.is_ok()) {
            pending_.pop_back();
            return dp::Result<SignedTransaction, dp::Error>::err(written.error());
        }
        return dp::Result<SignedTransaction, dp::Error>::ok(tx);
    }

    dp::Result<Block, dp::Error> LedgerPool::settle(const std::string &miner_name) {
        if (!vault_.hasAccount(miner_name))
            return dp::Result<Block, dp::Error>::err(unknown_account(errorText("Unknown miner: " + miner_name)));

        // A block whose balances never reached disk must be committed before another is appended
        if (uncommitted_) {
            auto retried = journal();
            if (!retried.is_ok())
                return dp::Result<Block, dp::Error>::err(retried.error());
        }

        // Dry run in insertion order with the reward already credited
        auto checked = dryRun(pending_, miner_name);
        if (!checked.is_ok())
            return dp::Result<Block, dp::Error>::err(checked.error());

        const std::string reward = coinbasePayload(options_.subsidy, miner_name);
        auto reward_signature = vault_.sign(miner_name, reward);
        if (!reward_signature.is_ok())
            return dp::Result<Block, dp::Error>::err(reward_signature.error());

        std::vector<std::string> transactions;
        transactions.reserve(pending_.size() + 1);
        for (const auto &tx : pending_)
            transactions.push_back(tx.toString());
        transactions.push_back(SignedMessage{reward, reward_signature.value()}.toString());

        auto block = chain_.assemble(transactions);
        if (!block.is_ok())
            return block;

        if (store_) {
            auto appended = store_->appendBlock(block.value());
            if (!appended.is_ok())
                return dp::Result<Block, dp::Error>::err(appended.error());
        }

        auto committed = chain_.commit(block.value());
        if (!committed.is_ok())
            return dp::Result<Block, dp::Error>::err(committed.error());

        auto applied = apply(pending_, miner_name);
        if (!applied.is_ok())
            return dp::Result<Block, dp::Error>::err(settlement_inconsistency(applied.error().message));

        const size_t settled = pending_.size();
        pending_.clear();

        if (store_) {
            uncommitted_ = true;
            auto committed = journal();
            if (!committed.is_ok()) {
                std::cerr << "Block #" << block.value().height
                          << " committed but balances and journal were not saved: "
                          << committed.error().message.c_str() << std::endl;
                return dp::Result<Block, dp::Error>::err(settlement_inconsistency(committed.error().message));
            }
        }

        std::cout << "Settled block #" << block.value().height << ": " << settled << " transfers, reward "
                  << options_.subsidy << " to " << miner_name << std::endl;
        return block;
    }

    dp::Result<void, dp::Error> LedgerPool::recover(const std::vector<SignedTransaction> &records) {
        auto tip = chain_.tip();
        if (!tip.is_ok())
            return dp::Result<void, dp::Error>::err(tip.error());
        const auto &transactions = tip.value().transactions;
        if (tip.value().height == 0 || transactions.empty())
            return dp::Result<void, dp::Error>::err(corrupt_segment("Unapplied tip block has no coinbase"));

        auto coinbase = SignedMessage::parse(transactions.back());
        if (!coinbase.is_ok())
            return dp::Result<void, dp::Error>::err(corrupt_segment(coinbase.error().message));
        auto miner = coinbaseMiner(coinbase.value().payload, options_.subsidy);
        if (!miner)
            return dp::Result<void, dp::Error>::err(
                corrupt_segment(errorText("Tip block does not end with a coinbase: " + coinbase.value().payload)));
        auto signed_by_miner = vault_.verify(*miner, coinbase.value().payload, coinbase.value().signature);
        if (!signed_by_miner.is_ok())
            return signed_by_miner;

        // The journal was not cleared, so it opens with exactly the block's transfers
        const size_t transfers = transactions.size() - 1;
        if (records.size() < transfers)
            return dp::Result<void, dp::Error>::err(
                corrupt_or_missing_store("Journal is missing transfers of the unapplied tip block"));
        for (size_t i = 0; i < transfers; i++) {
            auto message = SignedMessage::parse(transactions[i]);
            if (!message.is_ok() || message.value().payload != records[i].payload())
                return dp::Result<void, dp::Error>::err(corrupt_or_missing_store(
                    errorText("Journal disagrees with tip block at transfer " + std::to_string(i))));
        }

        const std::vector<SignedTransaction> settled(records.begin(), records.begin() + transfers);
        auto checked = dryRun(settled, *miner);
        if (!checked.is_ok())
            return checked;
        auto applied = apply(settled, *miner);
        if (!applied.is_ok())
            return applied;

        std::cerr << "Recovered balances of block #" << tip.value().height << ": " << transfers
                  << " transfers, reward " << options_.subsidy << " to " << *miner << std::endl;

        uncommitted_ = true;
        return restore(std::vector<SignedTransaction>(records.begin() + transfers, records.end()));
    }

    dp::Result<void, dp::Error> LedgerPool::restore(const std::vector<SignedTransaction> &records) {
        std::vector<SignedTransaction> restored;
        restored.reserve(records.size());

        for (const auto &record : records) {
            if (record.amount == 0)
                return dp::Result<void, dp::Error>::err(invalid_amount());
            if (!vault_.hasAccount(record.source))
                return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + record.source)));
            if (!vault_.hasAccount(record.dest))
                return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + record.dest)));

            SignedTransaction tx = record;
            if (tx.signature.empty()) {
                auto signature = vault_.sign(tx.source, tx.payload());
                if (!signature.is_ok())
                    return dp::Result<void, dp::Error>::err(signature.error());
                tx.signature = signature.value();
            } else {
                auto verified = vault_.verify(tx.source, tx.payload(), tx.signature);
                if (!verified.is_ok())
                    return verified;
            }
            restored.push_back(tx);
        }

        pending_ = std::move(restored);
        return journal();
    }

} // namespace minichain::ledger
