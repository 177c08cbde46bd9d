#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "account.hpp"

namespace minichain::storage {
    class SegmentStore;
}

namespace minichain::identity {

    /// Owns every account: keys, addresses and balances.
    /// When a store is attached, new accounts are appended to its address file.
    class IdentityVault {
      public:
        explicit IdentityVault(std::shared_ptr<storage::SegmentStore> store = nullptr);

        /// Create a named account with a fresh keypair and zero balance
        dp::Result<Account, dp::Error> createAccount(const std::string &name);

        /// Replace the vault contents with loaded accounts
        dp::Result<void, dp::Error> restore(const std::vector<Account> &accounts);

        bool hasAccount(const std::string &name) const;
        dp::Result<Account, dp::Error> getAccount(const std::string &name) const;
        dp::Result<uint64_t, dp::Error> balance(const std::string &name) const;

        static bool verifyAddress(const Account &account);
        dp::Result<bool, dp::Error> verifyAddress(const std::string &name) const;

        /// False for unknown accounts
        bool hasSufficientBalance(const std::string &name, uint64_t amount) const;

        // Unchecked primitives: callers validate sufficiency first
        dp::Result<void, dp::Error> debit(const std::string &name, uint64_t amount);
        dp::Result<void, dp::Error> credit(const std::string &name, uint64_t amount);

        /// Debit source and credit dest as one step; everything is validated before the debit
        dp::Result<void, dp::Error> moveBalance(const std::string &source, const std::string &dest, uint64_t amount);

        dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::string &name, const std::string &payload) const;

        /// Fails closed: any verifier failure is reported as an invalid signature
        dp::Result<void, dp::Error> verify(const std::string &name, const std::string &payload,
                                           const std::vector<uint8_t> &signature) const;

        /// Snapshot of all accounts ordered by name
        std::vector<Account> accounts() const;

        /// Balances keyed by name, used to dry-run settlement
        std::map<std::string, uint64_t> balanceSnapshot() const;

        uint64_t totalBalance() const;
        size_t size() const { return accounts_.size(); }

      private:
        std::map<std::string, Account> accounts_;
        std::shared_ptr<storage::SegmentStore> store_;
    };

} // namespace minichain::identity
