#pragma once

// Accounts, pending pool, chain and segmented storage

#include "common/digest.hpp"
#include "common/error.hpp"
#include "common/options.hpp"
#include "common/serializer.hpp"
#include "identity/identity.hpp"
#include "ledger/ledger.hpp"
#include "minichain_store.hpp"
#include "storage/segment_store.hpp"
