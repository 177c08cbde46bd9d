#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <string>

#include "common/options.hpp"
#include "identity/vault.hpp"
#include "ledger/block.hpp"
#include "ledger/chain.hpp"
#include "ledger/pool.hpp"
#include "ledger/sealer.hpp"
#include "ledger/transaction.hpp"
#include "storage/segment_store.hpp"

namespace minichain {

    // ===========================================
    // Minichain - accounts, pool, chain and storage together
    // ===========================================

    /// Owns the vault, pool, chain and segment store of one ledger directory.
    /// Call open() first, then initialize() on a fresh directory.
    class Minichain {
      public:
        explicit Minichain(const Options &options = Options{});
        ~Minichain() = default;

        Minichain(const Minichain &) = delete;
        Minichain &operator=(const Minichain &) = delete;

        /// Open a ledger directory and load whatever it holds
        /// @param path Directory holding metadata, address, genesis, transactions and data-<N>
        /// @return Result indicating success or the load error
        dp::Result<void, dp::Error> open(const std::string &path);

        /// Create the first account (if needed), credit it the subsidy and seal the genesis block
        /// @param miner_name Name of the genesis miner
        /// @return The genesis block
        dp::Result<ledger::Block, dp::Error> initialize(const std::string &miner_name);

        dp::Result<identity::Account, dp::Error> createAccount(const std::string &name);

        dp::Result<ledger::SignedTransaction, dp::Error> addTransaction(const std::string &source,
                                                                        const std::string &dest, uint64_t amount);

        /// Settle all pending transfers into a new block mined by `miner_name`
        dp::Result<ledger::Block, dp::Error> settle(const std::string &miner_name);

        /// Rewrite the whole directory from memory
        dp::Result<void, dp::Error> persistAll();

        /// Check a "<payload>|<base58 signature>" string against an account's key
        dp::Result<void, dp::Error> verifyTransaction(const std::string &name, const std::string &signed_text) const;

        bool isOpen() const { return store_ && store_->isOpen(); }
        bool isInitialized() const { return initialized_; }
        const Options &options() const { return options_; }

        identity::IdentityVault &vault() { return *vault_; }
        const identity::IdentityVault &vault() const { return *vault_; }
        ledger::ChainStore &chain() { return *chain_; }
        const ledger::ChainStore &chain() const { return *chain_; }
        ledger::LedgerPool &pool() { return *pool_; }
        const ledger::LedgerPool &pool() const { return *pool_; }
        storage::SegmentStore &store() { return *store_; }
        const storage::SegmentStore &store() const { return *store_; }

      private:
        void build();
        dp::Result<void, dp::Error> requireOpen() const;
        dp::Result<void, dp::Error> requireInitialized() const;

        Options options_;
        std::shared_ptr<storage::SegmentStore> store_;
        std::shared_ptr<ledger::Sealer> sealer_;
        std::unique_ptr<identity::IdentityVault> vault_;
        std::unique_ptr<ledger::ChainStore> chain_;
        std::unique_ptr<ledger::LedgerPool> pool_;
        bool initialized_ = false;
    };

} // namespace minichain
