#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <string>
#include <vector>

#include "../common/options.hpp"
#include "../identity/vault.hpp"
#include "block.hpp"
#include "chain.hpp"
#include "transaction.hpp"

namespace minichain::storage {
    class SegmentStore;
}

namespace minichain::ledger {

    /// Pending signed transfers waiting for the next settlement
    class LedgerPool {
      public:
        LedgerPool(identity::IdentityVault &vault, ChainStore &chain, std::shared_ptr<storage::SegmentStore> store,
                   const Options &options);

        /// Validate, sign and queue a transfer. The pool is unchanged on failure.
        dp::Result<SignedTransaction, dp::Error> addTransaction(const std::string &source, const std::string &dest,
                                                                uint64_t amount);

        /// Seal every pending transfer plus the miner's coinbase into a new block and apply it.
        /// Validation runs before sealing; SettlementInconsistency means the block and balances
        /// are applied in memory but could not be committed to the store. The next journal write
        /// retries that commit.
        dp::Result<Block, dp::Error> settle(const std::string &miner_name);

        /// Replay journal records; unsigned legacy records are signed now
        dp::Result<void, dp::Error> restore(const std::vector<SignedTransaction> &records);

        /// Apply the tip block's reward and transfers to balances after a crash left them unsaved,
        /// drop its transfers from the journal records and restore the rest
        dp::Result<void, dp::Error> recover(const std::vector<SignedTransaction> &records);

        size_t pendingCount() const { return pending_.size(); }
        const std::vector<SignedTransaction> &pending() const { return pending_; }

        /// Sum of queued amounts leaving an account
        uint64_t pendingOutgoing(const std::string &name) const;

      private:
        dp::Result<void, dp::Error> journal();
        dp::Result<void, dp::Error> dryRun(const std::vector<SignedTransaction> &records,
                                           const std::string &miner_name) const;
        dp::Result<void, dp::Error> apply(const std::vector<SignedTransaction> &records, const std::string &miner_name);

        identity::IdentityVault &vault_;
        ChainStore &chain_;
        std::shared_ptr<storage::SegmentStore> store_;
        Options options_;
        std::vector<SignedTransaction> pending_;
        bool uncommitted_ = false; // Last block's balances not yet committed to the store
    };

} // namespace minichain::ledger
