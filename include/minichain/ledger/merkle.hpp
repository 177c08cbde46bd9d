#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace minichain::ledger {

    /// One hop of an inclusion proof
    struct ProofStep {
        std::string sibling;
        bool sibling_on_left = false;
    };

    /// SHA-256 tree over a block's transaction strings.
    /// Leaves are sha256Hex(tx); parents are sha256Hex(left + right) over the hex digests, and the
    /// last node of an odd level is paired with itself.
    class MerkleTree {
      public:
        explicit MerkleTree(const std::vector<std::string> &transactions);

        /// Empty string when there are no transactions
        const std::string &root() const;
        size_t size() const { return levels_.empty() ? 0 : levels_.front().size(); }
        bool empty() const { return levels_.empty(); }

        dp::Result<std::vector<ProofStep>, dp::Error> proof(size_t index) const;

        static bool verify(const std::string &root, const std::string &transaction,
                           const std::vector<ProofStep> &proof);

      private:
        static std::string parentHash(const std::string &left, const std::string &right);

        std::vector<std::vector<std::string>> levels_;
    };

    std::string computeMerkleRoot(const std::vector<std::string> &transactions);

} // namespace minichain::ledger
