#include <minichain/common/digest.hpp>
#include <minichain/ledger/merkle.hpp>

namespace minichain::ledger {

    std::string MerkleTree::parentHash(const std::string &left, const std::string &right) {
        return sha256Hex(left + right);
    }

    MerkleTree::MerkleTree(const std::vector<std::string> &transactions) {
        if (transactions.empty())
            return;

        std::vector<std::string> level;
        level.reserve(transactions.size());
        for (const auto &tx : transactions)
            level.push_back(sha256Hex(tx));
        levels_.push_back(level);

        while (levels_.back().size() > 1) {
            const auto &below = levels_.back();
            std::vector<std::string> above;
            above.reserve((below.size() + 1) / 2);
            for (size_t i = 0; i < below.size(); i += 2) {
                const std::string &right = i + 1 < below.size() ? below[i + 1] : below[i];
                above.push_back(parentHash(below[i], right));
            }
            levels_.push_back(std::move(above));
        }
    }

    const std::string &MerkleTree::root() const {
        static const std::string none;
        return levels_.empty() ? none : levels_.back().front();
    }

    dp::Result<std::vector<ProofStep>, dp::Error> MerkleTree::proof(size_t index) const {
        if (index >= size())
            return dp::Result<std::vector<ProofStep>, dp::Error>::err(
                dp::Error::out_of_range("Transaction index out of range"));

        std::vector<ProofStep> steps;
        for (size_t depth = 0; depth + 1 < levels_.size(); depth++) {
            const auto &level = levels_[depth];
            ProofStep step;
            if (index % 2 == 1) {
                step.sibling = level[index - 1];
                step.sibling_on_left = true;
            } else {
                // Unpaired node hashes with itself
                step.sibling = index + 1 < level.size() ? level[index + 1] : level[index];
            }
            steps.push_back(step);
            index /= 2;
        }
        return dp::Result<std::vector<ProofStep>, dp::Error>::ok(steps);
    }

    bool MerkleTree::verify(const std::string &root, const std::string &transaction,
                            const std::vector<ProofStep> &proof) {
        if (root.empty())
            return false;
        std::string node = sha256Hex(transaction);
        for (const auto &step : proof)
            node = step.sibling_on_left ? parentHash(step.sibling, node) : parentHash(node, step.sibling);
        return node == root;
    }

    std::string computeMerkleRoot(const std::vector<std::string> &transactions) {
        return MerkleTree(transactions).root();
    }

} // namespace minichain::ledger
