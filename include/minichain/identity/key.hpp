#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "../common/error.hpp"

namespace minichain::identity {

    constexpr size_t VERIFYING_KEY_SIZE = 32;
    constexpr size_t SIGNATURE_SIZE = 64;

    /// Ed25519 signing/verifying key pair owned by one account.
    /// Header-only, backed by keylock.
    class AccountKey {
      public:
        static dp::Result<AccountKey, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();
            if (keypair.private_key.empty() || keypair.public_key.size() != VERIFYING_KEY_SIZE)
                return dp::Result<AccountKey, dp::Error>::err(dp::Error::io_error("Ed25519 key generation failed"));
            return dp::Result<AccountKey, dp::Error>::ok(AccountKey(keypair));
        }

        /// Rebuild from stored bytes. The signing key is the 32-byte seed or the 64-byte expanded form.
        static dp::Result<AccountKey, dp::Error> fromBytes(const std::vector<uint8_t> &verifying_key,
                                                           const std::vector<uint8_t> &signing_key) {
            if (verifying_key.size() != VERIFYING_KEY_SIZE)
                return dp::Result<AccountKey, dp::Error>::err(
                    dp::Error::invalid_argument("Verifying key must be 32 bytes"));
            if (signing_key.size() != 32 && signing_key.size() != 64)
                return dp::Result<AccountKey, dp::Error>::err(
                    dp::Error::invalid_argument("Signing key must be 32 or 64 bytes"));

            keylock::KeyPair keypair;
            keypair.public_key = verifying_key;
            keypair.private_key = signing_key;
            return dp::Result<AccountKey, dp::Error>::ok(AccountKey(keypair));
        }

        /// Signature over the payload's bytes
        dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::string &payload) const {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(bytes(payload), keypair_.private_key);
            if (!result.success)
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// Any mismatch, malformed signature included, is SignatureInvalid
        dp::Result<void, dp::Error> verify(const std::string &payload, const std::vector<uint8_t> &signature) const {
            if (signature.size() != SIGNATURE_SIZE)
                return dp::Result<void, dp::Error>::err(signature_invalid("Signature must be 64 bytes"));

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(bytes(payload), signature, keypair_.public_key);
            if (!result.success)
                return dp::Result<void, dp::Error>::err(signature_invalid());
            return dp::Result<void, dp::Error>::ok();
        }

        const std::vector<uint8_t> &verifyingKey() const { return keypair_.public_key; }
        const std::vector<uint8_t> &signingKey() const { return keypair_.private_key; }

        bool operator==(const AccountKey &other) const {
            return keypair_.public_key == other.keypair_.public_key &&
                   keypair_.private_key == other.keypair_.private_key;
        }
        bool operator!=(const AccountKey &other) const { return !(*this == other); }

      private:
        explicit AccountKey(keylock::KeyPair keypair) : keypair_(std::move(keypair)) {}

        static std::vector<uint8_t> bytes(const std::string &payload) {
            return std::vector<uint8_t>(payload.begin(), payload.end());
        }

        keylock::KeyPair keypair_;
    };

} // namespace minichain::identity
