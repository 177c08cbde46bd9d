#include <iostream>
#include <minichain/common/error.hpp>
#include <minichain/minichain_store.hpp>

namespace minichain {

    Minichain::Minichain(const Options &options)
        : options_(options), store_(std::make_shared<storage::SegmentStore>()) {
        build();
    }

    void Minichain::build() {
        sealer_ = std::make_shared<ledger::ProofOfWorkSealer>(options_.max_nonce);
        pool_.reset();
        chain_.reset();
        vault_ = std::make_unique<identity::IdentityVault>(store_);
        chain_ = std::make_unique<ledger::ChainStore>(*vault_, sealer_, options_);
        pool_ = std::make_unique<ledger::LedgerPool>(*vault_, *chain_, store_, options_);
    }

    dp::Result<void, dp::Error> Minichain::requireOpen() const {
        if (!isOpen())
            return dp::Result<void, dp::Error>::err(not_initialized("Ledger directory not open"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Minichain::requireInitialized() const {
        if (!isOpen() || !initialized_)
            return dp::Result<void, dp::Error>::err(not_initialized("Ledger has no genesis block yet"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Minichain::open(const std::string &path) {
        initialized_ = false;
        auto opened = store_->open(path, options_);
        if (!opened.is_ok())
            return opened;

        auto loaded = store_->load();
        if (!loaded.is_ok()) {
            std::cerr << "Failed to load ledger from " << path << ": " << loaded.error().message.c_str() << std::endl;
            return dp::Result<void, dp::Error>::err(loaded.error());
        }

        const auto &state = loaded.value();
        if (!state.initialized) {
            build();
            return dp::Result<void, dp::Error>::ok();
        }

        // Chain parameters recorded on disk win over the configured ones
        options_.difficulty_bits = state.metadata.difficulty_bits;
        options_.subsidy = state.metadata.subsidy;
        options_.segment_threshold = store_->threshold();
        build();

        auto accounts = vault_->restore(state.accounts);
        if (!accounts.is_ok())
            return accounts;

        // Blocks that parse but do not chain are segment corruption as well
        auto blocks = chain_->restore(state.blocks);
        if (!blocks.is_ok())
            return dp::Result<void, dp::Error>::err(corrupt_segment(blocks.error().message));

        auto verified = chain_->verifyChain();
        if (!verified.is_ok())
            return dp::Result<void, dp::Error>::err(corrupt_segment(verified.error().message));

        auto pending = state.tip_unapplied ? pool_->recover(state.pending) : pool_->restore(state.pending);
        if (!pending.is_ok())
            return pending;

        initialized_ = true;
        std::cout << "Loaded ledger from " << path << ": " << chain_->size() << " blocks, " << vault_->size()
                  << " accounts, " << pool_->pendingCount() << " pending transfers" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<ledger::Block, dp::Error> Minichain::initialize(const std::string &miner_name) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return dp::Result<ledger::Block, dp::Error>::err(ready.error());
        if (initialized_ || store_->isInitialized())
            return dp::Result<ledger::Block, dp::Error>::err(already_initialized());

        if (!vault_->hasAccount(miner_name)) {
            auto created = vault_->createAccount(miner_name);
            if (!created.is_ok())
                return dp::Result<ledger::Block, dp::Error>::err(created.error());
        }
        const auto accounts_before = vault_->accounts();

        auto credited = vault_->credit(miner_name, options_.subsidy);
        if (!credited.is_ok())
            return dp::Result<ledger::Block, dp::Error>::err(credited.error());

        auto genesis = chain_->genesis(miner_name);
        if (!genesis.is_ok()) {
            build();
            auto restored = vault_->restore(accounts_before);
            if (!restored.is_ok())
                return dp::Result<ledger::Block, dp::Error>::err(restored.error());
            return genesis;
        }

        auto stored = store_->initialize(genesis.value(), vault_->accounts());
        if (!stored.is_ok()) {
            build();
            auto restored = vault_->restore(accounts_before);
            if (!restored.is_ok())
                return dp::Result<ledger::Block, dp::Error>::err(restored.error());
            return dp::Result<ledger::Block, dp::Error>::err(stored.error());
        }

        initialized_ = true;
        std::cout << "Initialized ledger at " << store_->path().string() << " with genesis miner " << miner_name
                  << std::endl;
        return genesis;
    }

    dp::Result<identity::Account, dp::Error> Minichain::createAccount(const std::string &name) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return dp::Result<identity::Account, dp::Error>::err(ready.error());
        return vault_->createAccount(name);
    }

    dp::Result<ledger::SignedTransaction, dp::Error> Minichain::addTransaction(const std::string &source,
                                                                               const std::string &dest,
                                                                               uint64_t amount) {
        auto ready = requireInitialized();
        if (!ready.is_ok())
            return dp::Result<ledger::SignedTransaction, dp::Error>::err(ready.error());
        return pool_->addTransaction(source, dest, amount);
    }

    dp::Result<ledger::Block, dp::Error> Minichain::settle(const std::string &miner_name) {
        auto ready = requireInitialized();
        if (!ready.is_ok())
            return dp::Result<ledger::Block, dp::Error>::err(ready.error());
        return pool_->settle(miner_name);
    }

    dp::Result<void, dp::Error> Minichain::persistAll() {
        auto ready = requireInitialized();
        if (!ready.is_ok())
            return ready;
        return store_->persistAll(vault_->accounts(), pool_->pending(), chain_->blocks());
    }

    dp::Result<void, dp::Error> Minichain::verifyTransaction(const std::string &name,
                                                             const std::string &signed_text) const {
        auto message = ledger::SignedMessage::parse(signed_text);
        if (!message.is_ok())
            return dp::Result<void, dp::Error>::err(signature_invalid(message.error().message));
        return vault_->verify(name, message.value().payload, message.value().signature);
    }

} // namespace minichain
