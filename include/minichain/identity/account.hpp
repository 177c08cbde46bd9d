#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "key.hpp"

namespace minichain::identity {

    /// A named account: Ed25519 keypair, derived address and balance
    class Account {
      public:
        /// Generate a fresh keypair and derive its address; balance starts at zero
        static dp::Result<Account, dp::Error> create(const std::string &name);

        /// Rebuild from stored key material. An empty address is re-derived from the verifying key.
        static dp::Result<Account, dp::Error> fromKeys(const std::string &name, uint64_t balance,
                                                       const std::vector<uint8_t> &verifying_key,
                                                       const std::vector<uint8_t> &signing_key,
                                                       const std::string &address = "");

        /// base58(hash160(public_key) ++ SHA256(SHA256(hash160))) with the full 32-byte checksum
        static dp::Result<std::string, dp::Error> deriveAddress(const std::vector<uint8_t> &public_key);

        /// Recompute the address from the verifying key and compare
        static bool verifyAddress(const Account &account);

        const std::string &name() const { return name_; }
        uint64_t balance() const { return balance_; }
        const std::string &address() const { return address_; }
        const AccountKey &key() const { return key_; }

        void addBalance(uint64_t amount) { balance_ += amount; }
        void subBalance(uint64_t amount) { balance_ -= amount; }

        /// One JSON line: name, balance, signingKey, verifyingKey (base64), address
        std::string serialize() const;
        static dp::Result<Account, dp::Error> deserialize(const std::string &data);

        bool operator==(const Account &other) const {
            return name_ == other.name_ && balance_ == other.balance_ && address_ == other.address_ &&
                   key_ == other.key_;
        }
        bool operator!=(const Account &other) const { return !(*this == other); }

      private:
        Account(std::string name, uint64_t balance, AccountKey key, std::string address)
            : name_(std::move(name)), balance_(balance), key_(std::move(key)), address_(std::move(address)) {}

        std::string name_;
        uint64_t balance_;
        AccountKey key_;
        std::string address_;
    };

} // namespace minichain::identity
