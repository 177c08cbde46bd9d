#include <minichain/common/error.hpp>
#include <minichain/identity/vault.hpp>
#include <minichain/storage/segment_store.hpp>

namespace minichain::identity {

    IdentityVault::IdentityVault(std::shared_ptr<storage::SegmentStore> store) : store_(std::move(store)) {}

    dp::Result<Account, dp::Error> IdentityVault::createAccount(const std::string &name) {
        if (hasAccount(name))
            return dp::Result<Account, dp::Error>::err(duplicate_account(errorText("Account already exists: " + name)));

        auto account = Account::create(name);
        if (!account.is_ok())
            return account;

        if (store_) {
            auto saved = store_->appendAccount(account.value());
            if (!saved.is_ok())
                return dp::Result<Account, dp::Error>::err(saved.error());
        }

        accounts_.emplace(name, account.value());
        return account;
    }

    dp::Result<void, dp::Error> IdentityVault::restore(const std::vector<Account> &accounts) {
        std::map<std::string, Account> restored;
        for (const auto &account : accounts) {
            if (!restored.emplace(account.name(), account).second)
                return dp::Result<void, dp::Error>::err(
                    duplicate_account(errorText("Duplicate account record: " + account.name())));
        }
        accounts_ = std::move(restored);
        return dp::Result<void, dp::Error>::ok();
    }

    bool IdentityVault::hasAccount(const std::string &name) const { return accounts_.find(name) != accounts_.end(); }

    dp::Result<Account, dp::Error> IdentityVault::getAccount(const std::string &name) const {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<Account, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));
        return dp::Result<Account, dp::Error>::ok(it->second);
    }

    dp::Result<uint64_t, dp::Error> IdentityVault::balance(const std::string &name) const {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<uint64_t, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));
        return dp::Result<uint64_t, dp::Error>::ok(it->second.balance());
    }

    bool IdentityVault::verifyAddress(const Account &account) { return Account::verifyAddress(account); }

    dp::Result<bool, dp::Error> IdentityVault::verifyAddress(const std::string &name) const {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<bool, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));
        return dp::Result<bool, dp::Error>::ok(Account::verifyAddress(it->second));
    }

    bool IdentityVault::hasSufficientBalance(const std::string &name, uint64_t amount) const {
        auto it = accounts_.find(name);
        return it != accounts_.end() && it->second.balance() >= amount;
    }

    dp::Result<void, dp::Error> IdentityVault::debit(const std::string &name, uint64_t amount) {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));
        it->second.subBalance(amount);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> IdentityVault::credit(const std::string &name, uint64_t amount) {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));
        it->second.addBalance(amount);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> IdentityVault::moveBalance(const std::string &source, const std::string &dest,
                                                           uint64_t amount) {
        auto from = accounts_.find(source);
        if (from == accounts_.end())
            return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + source)));
        auto to = accounts_.find(dest);
        if (to == accounts_.end())
            return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + dest)));
        if (from->second.balance() < amount)
            return dp::Result<void, dp::Error>::err(
                insufficient_balance(errorText(source + " has no enough balance for transaction")));

        // Both iterators are valid, so the credit below cannot fail once the debit has run
        from->second.subBalance(amount);
        to->second.addBalance(amount);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<uint8_t>, dp::Error> IdentityVault::sign(const std::string &name,
                                                                    const std::string &payload) const {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                unknown_account(errorText("Unknown account: " + name)));
        return it->second.key().sign(payload);
    }

    dp::Result<void, dp::Error> IdentityVault::verify(const std::string &name, const std::string &payload,
                                                      const std::vector<uint8_t> &signature) const {
        auto it = accounts_.find(name);
        if (it == accounts_.end())
            return dp::Result<void, dp::Error>::err(unknown_account(errorText("Unknown account: " + name)));

        auto verified = it->second.key().verify(payload, signature);
        if (!verified.is_ok())
            return dp::Result<void, dp::Error>::err(
                signature_invalid(errorText("Signature does not match payload for " + name)));
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<Account> IdentityVault::accounts() const {
        std::vector<Account> result;
        result.reserve(accounts_.size());
        for (const auto &[name, account] : accounts_)
            result.push_back(account);
        return result;
    }

    std::map<std::string, uint64_t> IdentityVault::balanceSnapshot() const {
        std::map<std::string, uint64_t> snapshot;
        for (const auto &[name, account] : accounts_)
            snapshot[name] = account.balance();
        return snapshot;
    }

    uint64_t IdentityVault::totalBalance() const {
        uint64_t total = 0;
        for (const auto &[name, account] : accounts_)
            total += account.balance();
        return total;
    }

} // namespace minichain::identity
