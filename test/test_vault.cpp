#include <doctest/doctest.h>

#include <minichain/common/error.hpp>
#include <minichain/identity/vault.hpp>

using namespace minichain;
using namespace minichain::identity;

TEST_SUITE("Identity Vault Tests") {
    TEST_CASE("Create accounts") {
        IdentityVault vault;

        auto alice = vault.createAccount("alice");
        REQUIRE(alice.is_ok());
        CHECK(alice.value().balance() == 0);
        CHECK(vault.hasAccount("alice"));
        CHECK(vault.size() == 1);

        SUBCASE("Duplicate name is rejected") {
            auto again = vault.createAccount("alice");
            REQUIRE_FALSE(again.is_ok());
            CHECK(again.error().code == ERR_DUPLICATE_ACCOUNT);
            CHECK(vault.size() == 1);
        }

        SUBCASE("Addresses verify") {
            CHECK(IdentityVault::verifyAddress(alice.value()));
            auto by_name = vault.verifyAddress("alice");
            REQUIRE(by_name.is_ok());
            CHECK(by_name.value());
        }

        SUBCASE("Unknown account lookups") {
            CHECK_FALSE(vault.hasAccount("nobody"));
            auto balance = vault.balance("nobody");
            REQUIRE_FALSE(balance.is_ok());
            CHECK(balance.error().code == ERR_UNKNOWN_ACCOUNT);
            CHECK_FALSE(vault.getAccount("nobody").is_ok());
            CHECK_FALSE(vault.hasSufficientBalance("nobody", 0));
        }
    }

    TEST_CASE("Balances") {
        IdentityVault vault;
        REQUIRE(vault.createAccount("alice").is_ok());
        REQUIRE(vault.createAccount("bob").is_ok());

        REQUIRE(vault.credit("alice", 100).is_ok());
        CHECK(vault.balance("alice").value() == 100);
        CHECK(vault.hasSufficientBalance("alice", 100));
        CHECK_FALSE(vault.hasSufficientBalance("alice", 101));

        REQUIRE(vault.debit("alice", 40).is_ok());
        CHECK(vault.balance("alice").value() == 60);
        CHECK(vault.totalBalance() == 60);

        CHECK(vault.credit("nobody", 1).error().code == ERR_UNKNOWN_ACCOUNT);
        CHECK(vault.debit("nobody", 1).error().code == ERR_UNKNOWN_ACCOUNT);

        SUBCASE("Move balance") {
            REQUIRE(vault.moveBalance("alice", "bob", 25).is_ok());
            CHECK(vault.balance("alice").value() == 35);
            CHECK(vault.balance("bob").value() == 25);
            CHECK(vault.totalBalance() == 60);
        }

        SUBCASE("Move balance leaves both sides untouched on failure") {
            auto too_much = vault.moveBalance("alice", "bob", 61);
            REQUIRE_FALSE(too_much.is_ok());
            CHECK(too_much.error().code == ERR_INSUFFICIENT_BALANCE);

            auto unknown_dest = vault.moveBalance("alice", "nobody", 10);
            REQUIRE_FALSE(unknown_dest.is_ok());
            CHECK(unknown_dest.error().code == ERR_UNKNOWN_ACCOUNT);

            CHECK(vault.balance("alice").value() == 60);
            CHECK(vault.balance("bob").value() == 0);
        }

        SUBCASE("Snapshot") {
            auto snapshot = vault.balanceSnapshot();
            CHECK(snapshot.size() == 2);
            CHECK(snapshot["alice"] == 60);
            CHECK(snapshot["bob"] == 0);
        }
    }

    TEST_CASE("Sign and verify payloads") {
        IdentityVault vault;
        REQUIRE(vault.createAccount("alice").is_ok());
        REQUIRE(vault.createAccount("bob").is_ok());

        std::string payload = "from: alice -- to: bob -- amount: 5";
        auto signature = vault.sign("alice", payload);
        REQUIRE(signature.is_ok());

        CHECK(vault.verify("alice", payload, signature.value()).is_ok());

        SUBCASE("Altered payload byte") {
            std::string altered = payload;
            altered.back() = '6';
            auto result = vault.verify("alice", altered, signature.value());
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_SIGNATURE_INVALID);
        }

        SUBCASE("Altered signature byte") {
            auto altered = signature.value();
            altered[0] ^= 0x80;
            auto result = vault.verify("alice", payload, altered);
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_SIGNATURE_INVALID);
        }

        SUBCASE("Wrong signer") {
            auto result = vault.verify("bob", payload, signature.value());
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_SIGNATURE_INVALID);
        }

        SUBCASE("Garbage signature fails closed") {
            auto result = vault.verify("alice", payload, {0x01, 0x02});
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_SIGNATURE_INVALID);
        }

        CHECK(vault.sign("nobody", payload).error().code == ERR_UNKNOWN_ACCOUNT);
    }

    TEST_CASE("Restore accounts") {
        IdentityVault source;
        REQUIRE(source.createAccount("alice").is_ok());
        REQUIRE(source.createAccount("bob").is_ok());
        REQUIRE(source.credit("bob", 7).is_ok());

        IdentityVault restored;
        REQUIRE(restored.restore(source.accounts()).is_ok());
        CHECK(restored.size() == 2);
        CHECK(restored.balance("bob").value() == 7);
        CHECK(restored.getAccount("alice").value() == source.getAccount("alice").value());

        auto accounts = source.accounts();
        accounts.push_back(accounts.front());
        auto duplicate = restored.restore(accounts);
        REQUIRE_FALSE(duplicate.is_ok());
        CHECK(duplicate.error().code == ERR_DUPLICATE_ACCOUNT);
        CHECK(restored.size() == 2);
    }
}
