#include <minichain/common/digest.hpp>
#include <minichain/common/error.hpp>
#include <minichain/common/serializer.hpp>
#include <minichain/identity/account.hpp>
#include <sstream>

namespace minichain::identity {

    dp::Result<Account, dp::Error> Account::create(const std::string &name) {
        if (name.empty())
            return dp::Result<Account, dp::Error>::err(dp::Error::invalid_argument("Account name is empty"));

        auto key = AccountKey::generate();
        if (!key.is_ok())
            return dp::Result<Account, dp::Error>::err(key.error());

        auto address = deriveAddress(key.value().verifyingKey());
        if (!address.is_ok())
            return dp::Result<Account, dp::Error>::err(address.error());

        return dp::Result<Account, dp::Error>::ok(Account(name, 0, key.value(), address.value()));
    }

    dp::Result<Account, dp::Error> Account::fromKeys(const std::string &name, uint64_t balance,
                                                     const std::vector<uint8_t> &verifying_key,
                                                     const std::vector<uint8_t> &signing_key,
                                                     const std::string &address) {
        if (name.empty())
            return dp::Result<Account, dp::Error>::err(dp::Error::invalid_argument("Account name is empty"));

        auto key = AccountKey::fromBytes(verifying_key, signing_key);
        if (!key.is_ok())
            return dp::Result<Account, dp::Error>::err(key.error());

        if (!address.empty())
            return dp::Result<Account, dp::Error>::ok(Account(name, balance, key.value(), address));

        auto derived = deriveAddress(verifying_key);
        if (!derived.is_ok())
            return dp::Result<Account, dp::Error>::err(derived.error());
        return dp::Result<Account, dp::Error>::ok(Account(name, balance, key.value(), derived.value()));
    }

    dp::Result<std::string, dp::Error> Account::deriveAddress(const std::vector<uint8_t> &public_key) {
        auto key_hash = hash160(public_key);
        if (key_hash.empty())
            return dp::Result<std::string, dp::Error>::err(hash_failed("hash160 of verifying key failed"));

        // Full-length checksum, not the usual 4-byte prefix
        auto checksum = doubleSha256(key_hash);
        if (checksum.empty())
            return dp::Result<std::string, dp::Error>::err(hash_failed("Address checksum failed"));

        std::vector<uint8_t> payload(key_hash);
        payload.insert(payload.end(), checksum.begin(), checksum.end());
        return dp::Result<std::string, dp::Error>::ok(base58Encode(payload));
    }

    bool Account::verifyAddress(const Account &account) {
        auto derived = deriveAddress(account.key().verifyingKey());
        return derived.is_ok() && derived.value() == account.address();
    }

    std::string Account::serialize() const {
        std::stringstream ss;
        ss << '{';
        ss << "\"name\": " << JsonSerializer::quote(name_) << ", ";
        ss << "\"balance\": " << balance_ << ", ";
        ss << "\"signingKey\": \"" << base64Encode(key_.signingKey()) << "\", ";
        ss << "\"verifyingKey\": \"" << base64Encode(key_.verifyingKey()) << "\", ";
        ss << "\"address\": " << JsonSerializer::quote(address_);
        ss << '}';
        return ss.str();
    }

    dp::Result<Account, dp::Error> Account::deserialize(const std::string &data) {
        try {
            std::string name = JsonSerializer::extractString(data, "name");
            uint64_t balance = JsonSerializer::extractUint64(data, "balance");
            auto private_key = base64Decode(JsonSerializer::extractString(data, "signingKey"));
            auto public_key = base64Decode(JsonSerializer::extractString(data, "verifyingKey"));
            std::string address;
            if (JsonSerializer::hasKey(data, "address"))
                address = JsonSerializer::extractString(data, "address");
            return fromKeys(name, balance, public_key, private_key, address);
        } catch (const std::exception &e) {
            return dp::Result<Account, dp::Error>::err(dp::Error::invalid_argument(dp::String(e.what())));
        }
    }

} // namespace minichain::identity
