#pragma once

// Main include for the minichain ledger
#include "minichain/minichain.hpp"
