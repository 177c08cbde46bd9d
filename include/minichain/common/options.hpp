#pragma once

#include <cstdint>
#include <limits>

namespace minichain {

    /// Ledger configuration options
    struct Options {
        uint32_t difficulty_bits = 15;    // Leading zero bits a sealed block hash must carry
        uint64_t subsidy = 50;            // Coinbase reward credited to the miner of each block
        uint64_t segment_threshold = 100; // Blocks per data-<N> segment file
        uint64_t max_nonce = std::numeric_limits<uint64_t>::max();
        enum class Synchronous { NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::FULL;
    };

} // namespace minichain
