#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <string>
#include <vector>

#include "../common/options.hpp"
#include "../identity/vault.hpp"
#include "block.hpp"
#include "sealer.hpp"

namespace minichain::ledger {

    /// Ordered, append-only sequence of sealed blocks
    class ChainStore {
      public:
        ChainStore(identity::IdentityVault &vault, std::shared_ptr<Sealer> sealer, const Options &options);

        /// Seal and append block 0 carrying the miner-signed genesis message
        dp::Result<Block, dp::Error> genesis(const std::string &miner_name);

        /// Seal a block on top of the tip from the given transactions and append it
        dp::Result<Block, dp::Error> append(const std::vector<std::string> &transactions,
                                            const std::string &miner_name);

        /// Seal a block on top of the tip without appending it
        dp::Result<Block, dp::Error> assemble(const std::vector<std::string> &transactions) const;

        /// Append a block assembled on the current tip
        dp::Result<void, dp::Error> commit(const Block &block);

        /// True when both blocks commit to the same transaction set. This compares content only;
        /// use verifyChain() for ordering and linkage.
        static bool verifyLink(const Block &block_a, const Block &block_b);

        /// Full integrity check: heights, parent links, merkle roots, hashes and difficulty targets
        dp::Result<bool, dp::Error> verifyChain() const;

        dp::Result<Block, dp::Error> tip() const;

        /// Adopt blocks read from storage after checking heights and parent links
        dp::Result<void, dp::Error> restore(std::vector<Block> blocks);

        const std::vector<Block> &blocks() const { return blocks_; }
        size_t size() const { return blocks_.size(); }
        bool empty() const { return blocks_.empty(); }

      private:
        dp::Result<Block, dp::Error> sealBlock(int64_t height, const std::string &previous_hash,
                                               const std::vector<std::string> &transactions) const;

        identity::IdentityVault &vault_;
        std::shared_ptr<Sealer> sealer_;
        Options options_;
        std::vector<Block> blocks_;
    };

} // namespace minichain::ledger
