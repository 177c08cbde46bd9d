#pragma once

#include "account.hpp"
#include "key.hpp"
#include "vault.hpp"
