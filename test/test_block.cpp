#include <doctest/doctest.h>

#include <minichain/common/digest.hpp>
#include <minichain/common/error.hpp>
#include <minichain/ledger/block.hpp>
#include <minichain/ledger/merkle.hpp>
#include <minichain/ledger/sealer.hpp>

using namespace minichain;
using namespace minichain::ledger;

// Build and seal a block at low difficulty
static Block makeBlock(const std::vector<std::string> &transactions, int64_t height = 1,
                       const std::string &previous_hash = zeroDigestHex(), uint32_t bits = 4) {
    Block block;
    block.height = height;
    block.timestamp = 1700000000000;
    block.difficulty_bits = bits;
    block.transactions = transactions;
    block.previous_hash = previous_hash;
    block.merkle_root = computeMerkleRoot(transactions);

    ProofOfWorkSealer sealer(1000000);
    SealRequest request{block.height, block.timestamp, block.difficulty_bits, block.transactions,
                        block.merkle_root, block.previous_hash};
    auto seal = sealer.seal(request);
    REQUIRE(seal.is_ok());
    block.hash = seal.value().hash;
    block.nonce = seal.value().nonce;
    return block;
}

TEST_SUITE("Block Tests") {
    TEST_CASE("Block hash covers the header fields") {
        auto block = makeBlock({"tx-1", "tx-2"});

        CHECK(block.hash == block.calculateHash());
        CHECK(block.hash.size() == 64);
        CHECK(leadingZeroBits(block.hash) >= 4);

        auto valid = block.isValid();
        REQUIRE(valid.is_ok());
        CHECK(valid.value());

        std::string changed_nonce = Block::calculateHash(block.height, block.timestamp, block.difficulty_bits,
                                                         block.nonce + 1, block.merkle_root, block.previous_hash);
        CHECK(changed_nonce != block.hash);
    }

    TEST_CASE("Tampering is detected") {
        auto block = makeBlock({"tx-1", "tx-2", "tx-3"});

        SUBCASE("Transaction content") {
            block.transactions[1] = "tx-evil";
            auto result = block.isValid();
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_INVALID_BLOCK);
        }

        SUBCASE("Header field") {
            block.timestamp += 1;
            auto result = block.isValid();
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_INVALID_BLOCK);
        }

        SUBCASE("Stored hash") {
            block.hash[0] = block.hash[0] == 'f' ? 'e' : 'f';
            CHECK_FALSE(block.isValid().is_ok());
        }
    }

    TEST_CASE("Transaction inclusion") {
        auto block = makeBlock({"tx-1", "tx-2", "tx-3"});
        for (size_t i = 0; i < block.transactions.size(); i++) {
            auto included = block.verifyTransaction(i);
            REQUIRE(included.is_ok());
            CHECK(included.value());
        }
        CHECK_FALSE(block.verifyTransaction(3).is_ok());
    }

    TEST_CASE("Serialization") {
        auto block = makeBlock({"from: a -- to: b -- amount: 1|3xyz", "quote \" and | pipe"}, 7, std::string(64, 'a'));

        std::string line = block.serialize();
        CHECK(line.find('\n') == std::string::npos);

        auto restored = Block::deserialize(line);
        REQUIRE(restored.is_ok());
        CHECK(restored.value() == block);
        CHECK(restored.value().isValid().is_ok());

        auto broken = Block::deserialize("{\"height\": 1}");
        REQUIRE_FALSE(broken.is_ok());
        CHECK(broken.error().code == ERR_INVALID_BLOCK);
    }
}
