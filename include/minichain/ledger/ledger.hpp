#pragma once

#include "block.hpp"
#include "chain.hpp"
#include "merkle.hpp"
#include "pool.hpp"
#include "sealer.hpp"
#include "transaction.hpp"

namespace minichain::ledger {
    // Aggregates ledger headers under minichain::ledger
}
