#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace minichain::ledger {

    /// Block contents handed to a sealer
    struct SealRequest {
        int64_t height = 0;
        int64_t timestamp = 0;
        uint32_t difficulty_bits = 0;
        std::vector<std::string> transactions;
        std::string merkle_root;
        std::string previous_hash;
    };

    struct Seal {
        std::string hash;
        uint64_t nonce = 0;
    };

    /// Produces a hash and nonce whose hash meets the request's difficulty target
    class Sealer {
      public:
        virtual ~Sealer() = default;
        virtual dp::Result<Seal, dp::Error> seal(const SealRequest &request) = 0;
    };

    /// Brute-force nonce search over the block hash
    class ProofOfWorkSealer : public Sealer {
      public:
        explicit ProofOfWorkSealer(uint64_t max_nonce);

        dp::Result<Seal, dp::Error> seal(const SealRequest &request) override;

        static bool meetsTarget(const std::string &hash, uint32_t difficulty_bits);

      private:
        uint64_t max_nonce_;
    };

} // namespace minichain::ledger
