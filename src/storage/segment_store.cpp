#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <minichain/common/error.hpp>
#include <minichain/common/serializer.hpp>
#include <minichain/storage/segment_store.hpp>
#include <sstream>

namespace minichain::storage {

    // ===========================================
    // StoreMetadata
    // ===========================================

    std::string StoreMetadata::serialize() const {
        std::stringstream ss;
        ss << '{';
        ss << "\"difficultyBits\": " << difficulty_bits << ", ";
        ss << "\"subsidy\": " << subsidy << ", ";
        ss << "\"height\": " << height << ", ";
        ss << "\"segmentRecordCount\": " << segment_record_count << ", ";
        ss << "\"currentSegmentIndex\": " << current_segment_index << ", ";
        ss << "\"balancesHeight\": " << balances_height << ", ";
        ss << "\"segmentThreshold\": " << segment_threshold;
        ss << '}';
        return ss.str();
    }

    dp::Result<StoreMetadata, dp::Error> StoreMetadata::deserialize(const std::string &data) {
        try {
            StoreMetadata metadata;
            metadata.difficulty_bits = static_cast<uint32_t>(JsonSerializer::extractUint64(data, "difficultyBits"));
            metadata.subsidy = JsonSerializer::extractUint64(data, "subsidy");
            metadata.height = JsonSerializer::extractUint64(data, "height");
            metadata.segment_record_count = JsonSerializer::extractUint64(data, "segmentRecordCount");
            metadata.current_segment_index = JsonSerializer::extractUint64(data, "currentSegmentIndex");
            metadata.balances_height = JsonSerializer::hasKey(data, "balancesHeight")
                                           ? JsonSerializer::extractUint64(data, "balancesHeight")
                                           : metadata.height;
            if (JsonSerializer::hasKey(data, "segmentThreshold"))
                metadata.segment_threshold = JsonSerializer::extractUint64(data, "segmentThreshold");
            return dp::Result<StoreMetadata, dp::Error>::ok(metadata);
        } catch (const std::exception &e) {
            return dp::Result<StoreMetadata, dp::Error>::err(dp::Error::invalid_argument(dp::String(e.what())));
        }
    }

    // ===========================================
    // SegmentStore
    // ===========================================

    dp::Result<void, dp::Error> SegmentStore::open(const std::string &path, const Options &options) {
        if (options.segment_threshold == 0)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Segment threshold must be positive"));

        try {
            base_path_ = path;
            sync_mode_ = options.sync_mode;
            threshold_ = options.segment_threshold;
            difficulty_bits_ = options.difficulty_bits;
            subsidy_ = options.subsidy;
            height_ = 0;
            balances_height_ = 0;
            count_ = 0;
            index_ = 0;

            std::filesystem::create_directories(base_path_);
            is_open_ = true;
            return dp::Result<void, dp::Error>::ok();
        } catch (const std::exception &e) {
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
        }
    }

    bool SegmentStore::isInitialized() const {
        if (!is_open_)
            return false;
        std::error_code ec;
        return std::filesystem::exists(base_path_ / METADATA_FILE, ec);
    }

    dp::Result<void, dp::Error> SegmentStore::requireOpen() const {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));
        return dp::Result<void, dp::Error>::ok();
    }

    std::filesystem::path SegmentStore::segmentPath(uint64_t index) const {
        return base_path_ / (std::string(SEGMENT_PREFIX) + std::to_string(index));
    }

    std::optional<uint64_t> SegmentStore::parseSegmentIndex(const std::string &filename) {
        const std::string prefix = SEGMENT_PREFIX;
        if (filename.size() <= prefix.size() || filename.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;

        const std::string digits = filename.substr(prefix.size());
        if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return c >= '0' && c <= '9'; }))
            return std::nullopt;
        try {
            return std::stoull(digits);
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }

    std::vector<std::filesystem::path> SegmentStore::segmentFiles() const {
        std::vector<std::pair<uint64_t, std::filesystem::path>> found;
        std::error_code ec;
        if (!is_open_ || !std::filesystem::exists(base_path_, ec))
            return {};

        for (const auto &entry : std::filesystem::directory_iterator(base_path_, ec)) {
            if (!entry.is_regular_file())
                continue;
            auto index = parseSegmentIndex(entry.path().filename().string());
            if (index)
                found.emplace_back(*index, entry.path());
        }

        // data-2 must come before data-10
        std::sort(found.begin(), found.end(), [](const auto &a, const auto &b) { return a.first < b.first; });

        std::vector<std::filesystem::path> files;
        files.reserve(found.size());
        for (auto &[index, file] : found)
            files.push_back(std::move(file));
        return files;
    }

    StoreMetadata SegmentStore::metadata() const {
        StoreMetadata metadata;
        metadata.difficulty_bits = difficulty_bits_;
        metadata.subsidy = subsidy_;
        metadata.height = height_;
        metadata.segment_record_count = count_;
        metadata.current_segment_index = index_;
        metadata.balances_height = balances_height_;
        metadata.segment_threshold = threshold_;
        return metadata;
    }

    // ===========================================
    // File I/O
    // ===========================================

    dp::Result<void, dp::Error> SegmentStore::writeLines(const std::filesystem::path &file,
                                                         const std::vector<std::string> &lines, bool append) const {
        std::ofstream out(file, append ? std::ios::app : std::ios::trunc);
        if (!out)
            return dp::Result<void, dp::Error>::err(
                dp::Error::io_error(errorText("Failed to open " + file.string() + " for writing")));

        for (const auto &line : lines)
            out << line << '\n';

        if (sync_mode_ == Options::Synchronous::FULL)
            out.flush();

        if (!out)
            return dp::Result<void, dp::Error>::err(dp::Error::io_error(errorText("Failed to write " + file.string())));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<std::string>, dp::Error> SegmentStore::readLines(const std::filesystem::path &file) const {
        std::ifstream in(file);
        if (!in)
            return dp::Result<std::vector<std::string>, dp::Error>::err(
                corrupt_or_missing_store(errorText("Missing store file: " + file.filename().string())));

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                lines.push_back(line);
        }
        if (in.bad())
            return dp::Result<std::vector<std::string>, dp::Error>::err(
                dp::Error::io_error(errorText("Failed to read " + file.string())));
        return dp::Result<std::vector<std::string>, dp::Error>::ok(lines);
    }

    dp::Result<void, dp::Error> SegmentStore::removeSegments() const {
        for (const auto &file : segmentFiles()) {
            std::error_code ec;
            std::filesystem::remove(file, ec);
            if (ec)
                return dp::Result<void, dp::Error>::err(
                    dp::Error::io_error(errorText("Failed to remove " + file.string() + ": " + ec.message())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::filesystem::path SegmentStore::stagedPath(const char *name) const {
        return base_path_ / (std::string(name) + STAGED_SUFFIX);
    }

    dp::Result<void, dp::Error> SegmentStore::promoteStaged() const {
        for (const char *name : {ADDRESS_FILE, TRANSACTIONS_FILE}) {
            const auto staged = stagedPath(name);
            std::error_code ec;
            if (!std::filesystem::exists(staged, ec))
                continue;
            std::filesystem::rename(staged, base_path_ / name, ec);
            if (ec)
                return dp::Result<void, dp::Error>::err(
                    dp::Error::io_error(errorText("Failed to replace " + std::string(name) + ": " + ec.message())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SegmentStore::discardStaged() const {
        for (const char *name : {ADDRESS_FILE, TRANSACTIONS_FILE}) {
            std::error_code ec;
            std::filesystem::remove_all(stagedPath(name), ec);
            if (ec)
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(
                    errorText("Failed to remove " + stagedPath(name).string() + ": " + ec.message())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    static std::vector<std::string> accountLines(const std::vector<identity::Account> &accounts) {
        std::vector<std::string> lines;
        lines.reserve(accounts.size());
        for (const auto &account : accounts)
            lines.push_back(account.serialize());
        return lines;
    }

    static std::vector<std::string> pendingLines(const std::vector<ledger::SignedTransaction> &pending) {
        std::vector<std::string> lines;
        lines.reserve(pending.size());
        for (const auto &tx : pending)
            lines.push_back(tx.serialize());
        return lines;
    }

    // ===========================================
    // Writers
    // ===========================================

    dp::Result<void, dp::Error> SegmentStore::initialize(const ledger::Block &genesis,
                                                         const std::vector<identity::Account> &accounts) {
        if (isInitialized())
            return dp::Result<void, dp::Error>::err(
                already_initialized(errorText("Store already initialized at " + base_path_.string())));
        return persistAll(accounts, {}, {genesis});
    }

    dp::Result<void, dp::Error> SegmentStore::appendBlock(const ledger::Block &block) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;

        const uint64_t index = count_ / threshold_;
        auto written = writeLines(segmentPath(index), {block.serialize()}, true);
        if (!written.is_ok())
            return written;

        count_++;
        index_ = index;
        height_ = count_ + 1;
        return writeMetadata();
    }

    dp::Result<void, dp::Error> SegmentStore::appendAccount(const identity::Account &account) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;
        return writeLines(base_path_ / ADDRESS_FILE, {account.serialize()}, true);
    }

    dp::Result<void, dp::Error> SegmentStore::rewriteAccounts(const std::vector<identity::Account> &accounts) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;
        return writeLines(base_path_ / ADDRESS_FILE, accountLines(accounts), false);
    }

    dp::Result<void, dp::Error> SegmentStore::rewritePending(const std::vector<ledger::SignedTransaction> &pending) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;
        return writeLines(base_path_ / TRANSACTIONS_FILE, pendingLines(pending), false);
    }

    dp::Result<void, dp::Error> SegmentStore::writeGenesis(const ledger::Block &genesis) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;
        if (genesis.height != 0)
            return dp::Result<void, dp::Error>::err(invalid_block("Genesis block must have height 0"));
        return writeLines(base_path_ / GENESIS_FILE, {genesis.serialize()}, false);
    }

    dp::Result<void, dp::Error> SegmentStore::writeMetadata() {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;

        // Readers see either the previous or the new metadata, never a torn file
        const auto target = base_path_ / METADATA_FILE;
        const auto staging = base_path_ / (std::string(METADATA_FILE) + ".tmp");
        auto written = writeLines(staging, {metadata().serialize()}, false);
        if (!written.is_ok())
            return written;

        std::error_code ec;
        std::filesystem::rename(staging, target, ec);
        if (ec)
            return dp::Result<void, dp::Error>::err(
                dp::Error::io_error(errorText("Failed to replace metadata: " + ec.message())));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SegmentStore::commitSettlement(const std::vector<identity::Account> &accounts,
                                                               const std::vector<ledger::SignedTransaction> &pending) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;

        auto staged_accounts = writeLines(stagedPath(ADDRESS_FILE), accountLines(accounts), false);
        if (!staged_accounts.is_ok())
            return staged_accounts;
        auto staged_pending = writeLines(stagedPath(TRANSACTIONS_FILE), pendingLines(pending), false);
        if (!staged_pending.is_ok())
            return staged_pending;

        // The metadata rename is the commit point for both staged files
        const uint64_t previous = balances_height_;
        balances_height_ = height_;
        auto committed = writeMetadata();
        if (!committed.is_ok()) {
            balances_height_ = previous;
            auto discarded = discardStaged();
            if (!discarded.is_ok())
                std::cerr << "Stale staged files left in " << base_path_.string() << ": "
                          << discarded.error().message.c_str() << std::endl;
            return committed;
        }
        return promoteStaged();
    }

    dp::Result<void, dp::Error> SegmentStore::persistAll(const std::vector<identity::Account> &accounts,
                                                         const std::vector<ledger::SignedTransaction> &pending,
                                                         const std::vector<ledger::Block> &blocks) {
        auto ready = requireOpen();
        if (!ready.is_ok())
            return ready;
        if (blocks.empty())
            return dp::Result<void, dp::Error>::err(empty_chain("Cannot persist a chain without a genesis block"));

        auto genesis = writeGenesis(blocks.front());
        if (!genesis.is_ok())
            return genesis;
        auto removed = removeSegments();
        if (!removed.is_ok())
            return removed;

        // data-0 exists even before the first settled block
        std::map<uint64_t, std::vector<std::string>> segments{{0, {}}};
        for (size_t i = 1; i < blocks.size(); i++)
            segments[(i - 1) / threshold_].push_back(blocks[i].serialize());

        for (const auto &[index, lines] : segments) {
            auto written = writeLines(segmentPath(index), lines, false);
            if (!written.is_ok())
                return written;
        }

        count_ = blocks.size() - 1;
        index_ = count_ == 0 ? 0 : (count_ - 1) / threshold_;
        height_ = blocks.size();
        return commitSettlement(accounts, pending);
    }

    // ===========================================
    // Loader
    // ===========================================

    dp::Result<LoadedState, dp::Error> SegmentStore::load() {
        if (!is_open_)
            return dp::Result<LoadedState, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

        LoadedState state;
        if (!isInitialized())
            return dp::Result<LoadedState, dp::Error>::ok(state);

        // Metadata
        auto metadata_lines = readLines(base_path_ / METADATA_FILE);
        if (!metadata_lines.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(metadata_lines.error());
        if (metadata_lines.value().empty())
            return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store("Metadata file is empty"));

        auto metadata = StoreMetadata::deserialize(metadata_lines.value().front());
        if (!metadata.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(
                corrupt_or_missing_store(errorText("Unreadable metadata: " + std::string(metadata.error().message.c_str()))));
        if (metadata.value().height == 0 || metadata.value().segment_record_count != metadata.value().height - 1)
            return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store("Metadata counters disagree"));
        // At most the tip block may be missing from the balances
        if (metadata.value().balances_height > metadata.value().height ||
            metadata.value().balances_height + 1 < metadata.value().height)
            return dp::Result<LoadedState, dp::Error>::err(
                corrupt_or_missing_store("Balances are more than one block behind the chain"));
        state.metadata = metadata.value();
        state.tip_unapplied = state.metadata.balances_height + 1 == state.metadata.height;

        // Staged files are valid only once metadata has committed them
        auto staged = state.tip_unapplied ? discardStaged() : promoteStaged();
        if (!staged.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(staged.error());

        // Accounts
        auto account_lines = readLines(base_path_ / ADDRESS_FILE);
        if (!account_lines.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(account_lines.error());
        for (const auto &line : account_lines.value()) {
            auto account = identity::Account::deserialize(line);
            if (!account.is_ok())
                return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store(
                    errorText("Unreadable account record: " + std::string(account.error().message.c_str()))));
            state.accounts.push_back(account.value());
        }

        // Pending journal
        auto pending_lines = readLines(base_path_ / TRANSACTIONS_FILE);
        if (!pending_lines.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(pending_lines.error());
        for (const auto &line : pending_lines.value()) {
            auto tx = ledger::SignedTransaction::deserialize(line);
            if (!tx.is_ok())
                return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store(
                    errorText("Unreadable pending record: " + std::string(tx.error().message.c_str()))));
            state.pending.push_back(tx.value());
        }

        // Genesis
        auto genesis_lines = readLines(base_path_ / GENESIS_FILE);
        if (!genesis_lines.is_ok())
            return dp::Result<LoadedState, dp::Error>::err(genesis_lines.error());
        if (genesis_lines.value().empty())
            return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store("Genesis file is empty"));
        auto genesis = ledger::Block::deserialize(genesis_lines.value().front());
        if (!genesis.is_ok() || genesis.value().height != 0)
            return dp::Result<LoadedState, dp::Error>::err(corrupt_or_missing_store("Unreadable genesis block"));
        state.blocks.push_back(genesis.value());

        // Segments. Only the records covered by metadata are trusted; a block appended without its
        // metadata update is dropped and its segment rewritten.
        const uint64_t trusted = state.metadata.segment_record_count;
        uint64_t loaded = 0;
        uint64_t surplus = 0;
        std::vector<std::pair<std::filesystem::path, std::vector<std::string>>> repairs;

        for (const auto &file : segmentFiles()) {
            auto lines = readLines(file);
            if (!lines.is_ok())
                return dp::Result<LoadedState, dp::Error>::err(lines.error());

            std::vector<std::string> kept;
            size_t line_number = 0;
            for (const auto &line : lines.value()) {
                line_number++;
                if (loaded >= trusted) {
                    surplus++;
                    continue;
                }
                auto block = ledger::Block::deserialize(line);
                if (!block.is_ok())
                    return dp::Result<LoadedState, dp::Error>::err(corrupt_segment(errorText(
                        file.filename().string() + ":" + std::to_string(line_number) + ": " +
                        std::string(block.error().message.c_str()))));
                state.blocks.push_back(block.value());
                kept.push_back(line);
                loaded++;
            }
            if (kept.size() != lines.value().size())
                repairs.emplace_back(file, std::move(kept));
        }

        if (loaded < trusted)
            return dp::Result<LoadedState, dp::Error>::err(corrupt_segment(
                errorText("Segments hold " + std::to_string(loaded) + " of " + std::to_string(trusted) + " blocks")));

        if (surplus > 0) {
            std::cerr << "Dropping " << surplus << " unrecorded block(s) from " << base_path_.string() << std::endl;
            for (const auto &[file, kept] : repairs) {
                if (kept.empty() && file != segmentPath(0)) {
                    std::error_code ec;
                    std::filesystem::remove(file, ec);
                    if (ec)
                        return dp::Result<LoadedState, dp::Error>::err(dp::Error::io_error(
                            errorText("Failed to remove " + file.string() + ": " + ec.message())));
                    continue;
                }
                auto repaired = writeLines(file, kept, false);
                if (!repaired.is_ok())
                    return dp::Result<LoadedState, dp::Error>::err(repaired.error());
            }
        }

        difficulty_bits_ = state.metadata.difficulty_bits;
        subsidy_ = state.metadata.subsidy;
        height_ = state.metadata.height;
        balances_height_ = state.metadata.balances_height;
        count_ = trusted;
        index_ = state.metadata.current_segment_index;
        // New blocks keep following the layout already on disk
        if (state.metadata.segment_threshold != 0)
            threshold_ = state.metadata.segment_threshold;

        state.initialized = true;
        return dp::Result<LoadedState, dp::Error>::ok(state);
    }

} // namespace minichain::storage
