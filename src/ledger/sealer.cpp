#include <minichain/common/digest.hpp>
#include <minichain/common/error.hpp>
#include <minichain/ledger/block.hpp>
#include <minichain/ledger/sealer.hpp>

namespace minichain::ledger {

    ProofOfWorkSealer::ProofOfWorkSealer(uint64_t max_nonce) : max_nonce_(max_nonce) {}

    bool ProofOfWorkSealer::meetsTarget(const std::string &hash, uint32_t difficulty_bits) {
        return !hash.empty() && leadingZeroBits(hash) >= difficulty_bits;
    }

    dp::Result<Seal, dp::Error> ProofOfWorkSealer::seal(const SealRequest &request) {
        if (request.difficulty_bits > 256)
            return dp::Result<Seal, dp::Error>::err(seal_failed("Difficulty exceeds digest width"));

        for (uint64_t nonce = 0;; ++nonce) {
            std::string hash = Block::calculateHash(request.height, request.timestamp, request.difficulty_bits, nonce,
                                                    request.merkle_root, request.previous_hash);
            if (hash.empty())
                return dp::Result<Seal, dp::Error>::err(hash_failed("Failed to calculate block hash"));
            if (meetsTarget(hash, request.difficulty_bits))
                return dp::Result<Seal, dp::Error>::ok(Seal{hash, nonce});
            if (nonce == max_nonce_)
                break;
        }
        return dp::Result<Seal, dp::Error>::err(
            seal_failed(errorText("No nonce up to " + std::to_string(max_nonce_) + " meets the target")));
    }

} // namespace minichain::ledger
