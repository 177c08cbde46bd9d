#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../common/options.hpp"
#include "../identity/account.hpp"
#include "../ledger/block.hpp"
#include "../ledger/transaction.hpp"

namespace minichain::storage {

    // Reserved file names inside a store directory
    inline constexpr const char *METADATA_FILE = "metadata";
    inline constexpr const char *ADDRESS_FILE = "address";
    inline constexpr const char *GENESIS_FILE = "genesis";
    inline constexpr const char *TRANSACTIONS_FILE = "transactions";
    inline constexpr const char *SEGMENT_PREFIX = "data-";
    inline constexpr const char *STAGED_SUFFIX = ".staged";

    /// Chain counters persisted as a single JSON object
    struct StoreMetadata {
        uint32_t difficulty_bits = 0;
        uint64_t subsidy = 0;
        uint64_t height = 0;               // Blocks in the chain, genesis included
        uint64_t segment_record_count = 0; // Blocks held by data-<N> files
        uint64_t current_segment_index = 0;
        uint64_t balances_height = 0;      // Chain height the address file balances reflect
        uint64_t segment_threshold = 0;    // 0 when written before the threshold was recorded

        std::string serialize() const;
        static dp::Result<StoreMetadata, dp::Error> deserialize(const std::string &data);
    };

    /// Everything load() reconstructs from a store directory
    struct LoadedState {
        bool initialized = false;
        StoreMetadata metadata;
        std::vector<identity::Account> accounts;
        std::vector<ledger::SignedTransaction> pending;
        std::vector<ledger::Block> blocks;

        /// The tip block is durable but its balances and journal clear are not
        bool tip_unapplied = false;
    };

    // ===========================================
    // SegmentStore - flat-file ledger persistence
    // ===========================================

    /// Directory layout:
    ///   metadata      chain counters, rewritten after every block
    ///   address       one account per line, replaced after every settlement
    ///   genesis       block 0, written once
    ///   transactions  pending transfer journal, rewritten on every pool change
    ///   data-<N>      append-only segments of up to `segment_threshold` blocks
    /// Every operation opens and closes its own file stream.
    /// Settled balances and the cleared journal are first written as <name>.staged; the metadata
    /// write that raises balancesHeight to height commits them, and load() finishes or discards them.
    class SegmentStore {
      public:
        SegmentStore() = default;

        SegmentStore(const SegmentStore &) = delete;
        SegmentStore &operator=(const SegmentStore &) = delete;

        /// Open or create the store directory
        dp::Result<void, dp::Error> open(const std::string &path, const Options &options = Options{});

        bool isOpen() const { return is_open_; }

        /// A store is initialized once its metadata file exists
        bool isInitialized() const;

        /// Write a fresh store holding only the genesis block and the given accounts
        dp::Result<void, dp::Error> initialize(const ledger::Block &genesis,
                                               const std::vector<identity::Account> &accounts);

        /// Append one block to the active segment, rotating when the threshold is crossed
        dp::Result<void, dp::Error> appendBlock(const ledger::Block &block);

        dp::Result<void, dp::Error> appendAccount(const identity::Account &account);
        dp::Result<void, dp::Error> rewriteAccounts(const std::vector<identity::Account> &accounts);
        dp::Result<void, dp::Error> rewritePending(const std::vector<ledger::SignedTransaction> &pending);
        dp::Result<void, dp::Error> writeGenesis(const ledger::Block &genesis);
        dp::Result<void, dp::Error> writeMetadata();

        /// Make accounts and pending records durable for the current height
        dp::Result<void, dp::Error> commitSettlement(const std::vector<identity::Account> &accounts,
                                                     const std::vector<ledger::SignedTransaction> &pending);

        /// Rebuild accounts, pending pool and chain from disk. The journal is left in place.
        dp::Result<LoadedState, dp::Error> load();

        /// Rewrite every file from in-memory state; metadata goes last
        dp::Result<void, dp::Error> persistAll(const std::vector<identity::Account> &accounts,
                                               const std::vector<ledger::SignedTransaction> &pending,
                                               const std::vector<ledger::Block> &blocks);

        /// Segment files ordered by the numeric index in their name
        std::vector<std::filesystem::path> segmentFiles() const;

        /// Index embedded in a "data-<N>" file name
        static std::optional<uint64_t> parseSegmentIndex(const std::string &filename);

        std::filesystem::path segmentPath(uint64_t index) const;
        const std::filesystem::path &path() const { return base_path_; }

        StoreMetadata metadata() const;
        uint64_t recordCount() const { return count_; }
        uint64_t currentSegmentIndex() const { return index_; }
        uint64_t threshold() const { return threshold_; }

      private:
        dp::Result<void, dp::Error> writeLines(const std::filesystem::path &file, const std::vector<std::string> &lines,
                                               bool append) const;
        dp::Result<std::vector<std::string>, dp::Error> readLines(const std::filesystem::path &file) const;
        dp::Result<void, dp::Error> removeSegments() const;
        std::filesystem::path stagedPath(const char *name) const;
        dp::Result<void, dp::Error> promoteStaged() const;
        dp::Result<void, dp::Error> discardStaged() const;

        dp::Result<void, dp::Error> requireOpen() const;

        std::filesystem::path base_path_;
        bool is_open_ = false;
        Options::Synchronous sync_mode_ = Options::Synchronous::FULL;

        uint64_t threshold_ = 100;
        uint32_t difficulty_bits_ = 0;
        uint64_t subsidy_ = 0;
        uint64_t height_ = 0;
        uint64_t balances_height_ = 0;
        uint64_t count_ = 0;
        uint64_t index_ = 0;
    };

} // namespace minichain::storage
