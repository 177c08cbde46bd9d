#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <minichain/minichain.hpp>

using namespace minichain;

// Test helper: ledger directory removed before and after each test
struct TestLedger {
    std::string path;
    Options options;

    explicit TestLedger(const std::string &name) : path(name + "_ledger") {
        cleanup();
        options.difficulty_bits = 4;
        options.segment_threshold = 2;
    }

    ~TestLedger() { cleanup(); }

    void cleanup() {
        if (std::filesystem::exists(path))
            std::filesystem::remove_all(path);
    }
};

static size_t countLines(const std::filesystem::path &file) {
    std::ifstream in(file);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line))
        if (!line.empty())
            lines++;
    return lines;
}

TEST_SUITE("Ledger Integration Tests") {
    TEST_CASE("Operations need an open, initialized ledger") {
        Minichain ledger;
        CHECK_FALSE(ledger.isOpen());
        CHECK(ledger.createAccount("A").error().code == ERR_NOT_INITIALIZED);
        CHECK(ledger.initialize("A").error().code == ERR_NOT_INITIALIZED);

        TestLedger t("integration_uninit");
        Minichain opened(t.options);
        REQUIRE(opened.open(t.path).is_ok());
        CHECK_FALSE(opened.isInitialized());
        REQUIRE(opened.createAccount("B").is_ok());
        CHECK(opened.addTransaction("B", "B", 1).error().code == ERR_NOT_INITIALIZED);
        CHECK(opened.settle("B").error().code == ERR_NOT_INITIALIZED);
        CHECK(opened.persistAll().error().code == ERR_NOT_INITIALIZED);
    }

    TEST_CASE("Initialize seals genesis and rewards the first miner") {
        TestLedger t("integration_init");
        Minichain ledger(t.options);
        REQUIRE(ledger.open(t.path).is_ok());

        auto genesis = ledger.initialize("A");
        REQUIRE(genesis.is_ok());
        CHECK(ledger.isInitialized());
        CHECK(genesis.value().height == 0);
        CHECK(ledger.vault().balance("A").value() == t.options.subsidy);
        CHECK(ledger.chain().size() == 1);
        CHECK(ledger.verifyTransaction("A", genesis.value().transactions[0]).is_ok());

        auto again = ledger.initialize("A");
        REQUIRE_FALSE(again.is_ok());
        CHECK(again.error().code == ERR_ALREADY_INITIALIZED);

        SUBCASE("A second handle on the directory sees the same ledger") {
            Minichain other(t.options);
            REQUIRE(other.open(t.path).is_ok());
            CHECK(other.isInitialized());
            CHECK(other.chain().blocks() == ledger.chain().blocks());
            CHECK(other.initialize("Z").error().code == ERR_ALREADY_INITIALIZED);
        }
    }

    TEST_CASE("Transfer, reject and settle") {
        TestLedger t("integration_transfer");
        Minichain ledger(t.options);
        REQUIRE(ledger.open(t.path).is_ok());
        REQUIRE(ledger.initialize("A").is_ok());
        REQUIRE(ledger.createAccount("B").is_ok());
        CHECK(ledger.createAccount("B").error().code == ERR_DUPLICATE_ACCOUNT);

        // Bring A to 100
        REQUIRE(ledger.vault().credit("A", 100 - t.options.subsidy).is_ok());
        REQUIRE(ledger.persistAll().is_ok());
        REQUIRE(ledger.vault().balance("A").value() == 100);

        auto first = ledger.addTransaction("A", "B", 30);
        REQUIRE(first.is_ok());

        auto second = ledger.addTransaction("A", "B", 80);
        REQUIRE_FALSE(second.is_ok());
        CHECK(second.error().code == ERR_INSUFFICIENT_BALANCE);
        CHECK(ledger.pool().pendingCount() == 1);

        const uint64_t before = ledger.vault().totalBalance();
        auto tip = ledger.chain().tip();
        REQUIRE(tip.is_ok());

        auto block = ledger.settle("A");
        REQUIRE(block.is_ok());
        CHECK(block.value().previous_hash == tip.value().hash);
        CHECK(ledger.vault().balance("A").value() == 100 - 30 + t.options.subsidy);
        CHECK(ledger.vault().balance("B").value() == 30);
        CHECK(ledger.vault().totalBalance() == before + t.options.subsidy);
        CHECK(ledger.pool().pendingCount() == 0);
        CHECK(ledger.verifyTransaction("A", block.value().transactions[0]).is_ok());
        CHECK(ledger.verifyTransaction("B", block.value().transactions[0]).error().code == ERR_SIGNATURE_INVALID);
        CHECK(ledger.verifyTransaction("A", "no separator").error().code == ERR_SIGNATURE_INVALID);
    }

    TEST_CASE("Reopen reproduces the ledger") {
        TestLedger t("integration_reopen");
        std::vector<ledger::Block> blocks;
        std::vector<identity::Account> accounts;

        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
            REQUIRE(ledger.createAccount("B").is_ok());
            REQUIRE(ledger.createAccount("C").is_ok());

            for (int round = 0; round < 3; round++) {
                REQUIRE(ledger.addTransaction("A", "B", 5).is_ok());
                REQUIRE(ledger.addTransaction("A", "C", 5).is_ok());
                REQUIRE(ledger.settle(round % 2 == 0 ? "B" : "C").is_ok());
            }
            REQUIRE(ledger.addTransaction("B", "C", 3).is_ok());

            blocks = ledger.chain().blocks();
            accounts = ledger.vault().accounts();
        }

        Minichain reopened(t.options);
        REQUIRE(reopened.open(t.path).is_ok());
        CHECK(reopened.isInitialized());
        CHECK(reopened.chain().blocks() == blocks);
        CHECK(reopened.vault().accounts() == accounts);
        CHECK(reopened.chain().verifyChain().is_ok());

        // The pending transfer survives and can still be settled
        REQUIRE(reopened.pool().pendingCount() == 1);
        CHECK(reopened.pool().pending()[0].amount == 3);
        auto block = reopened.settle("A");
        REQUIRE(block.is_ok());
        CHECK(block.value().height == 4);
        CHECK(reopened.vault().balance("C").value() == 15 + t.options.subsidy + 3);
    }

    TEST_CASE("Stored chain parameters override options") {
        TestLedger t("integration_params");
        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
        }

        Options other = t.options;
        other.difficulty_bits = 6;
        other.subsidy = 7;

        Minichain reopened(other);
        REQUIRE(reopened.open(t.path).is_ok());
        CHECK(reopened.options().difficulty_bits == 4);
        CHECK(reopened.options().subsidy == t.options.subsidy);

        auto block = reopened.settle("A");
        REQUIRE(block.is_ok());
        CHECK(block.value().difficulty_bits == 4);
        CHECK(reopened.vault().balance("A").value() == 2 * t.options.subsidy);
    }

    TEST_CASE("Persist all then reopen") {
        TestLedger t("integration_persist");
        std::vector<ledger::Block> blocks;
        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
            REQUIRE(ledger.createAccount("B").is_ok());
            for (int i = 0; i < 3; i++)
                REQUIRE(ledger.settle("B").is_ok());
            REQUIRE(ledger.persistAll().is_ok());
            blocks = ledger.chain().blocks();
        }

        Minichain reopened(t.options);
        REQUIRE(reopened.open(t.path).is_ok());
        CHECK(reopened.chain().blocks() == blocks);
        CHECK(reopened.pool().pendingCount() == 0);
        CHECK(reopened.vault().balance("B").value() == 3 * t.options.subsidy);
    }

    TEST_CASE("Settlement interrupted after the block is durable") {
        TestLedger t("integration_interrupted");
        std::vector<ledger::Block> blocks;
        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
            REQUIRE(ledger.createAccount("B").is_ok());
            REQUIRE(ledger.vault().credit("A", 100 - t.options.subsidy).is_ok());
            REQUIRE(ledger.persistAll().is_ok());
            REQUIRE(ledger.addTransaction("A", "B", 30).is_ok());

            // Seal and append the block, then stop before balances and journal are written
            std::vector<std::string> transactions{ledger.pool().pending()[0].toString()};
            const std::string reward = ledger::coinbasePayload(t.options.subsidy, "A");
            auto signature = ledger.vault().sign("A", reward);
            REQUIRE(signature.is_ok());
            transactions.push_back(ledger::SignedMessage{reward, signature.value()}.toString());
            auto block = ledger.chain().assemble(transactions);
            REQUIRE(block.is_ok());
            REQUIRE(ledger.store().appendBlock(block.value()).is_ok());
            REQUIRE(ledger.chain().commit(block.value()).is_ok());
            blocks = ledger.chain().blocks();
        }

        Minichain reopened(t.options);
        REQUIRE(reopened.open(t.path).is_ok());
        CHECK(reopened.chain().blocks() == blocks);
        CHECK(reopened.vault().balance("A").value() == 100 - 30 + t.options.subsidy);
        CHECK(reopened.vault().balance("B").value() == 30);
        CHECK(reopened.pool().pendingCount() == 0);
        CHECK(reopened.store().metadata().balances_height == reopened.store().metadata().height);

        // The transfer is not sealed a second time
        auto next = reopened.settle("A");
        REQUIRE(next.is_ok());
        CHECK(next.value().transactions.size() == 1);
        CHECK(reopened.vault().balance("B").value() == 30);
        CHECK(reopened.vault().balance("A").value() == 100 - 30 + 2 * t.options.subsidy);

        SUBCASE("Recovery is applied once") {
            Minichain again(t.options);
            REQUIRE(again.open(t.path).is_ok());
            CHECK(again.vault().accounts() == reopened.vault().accounts());
            CHECK(again.chain().blocks() == reopened.chain().blocks());
        }
    }

    TEST_CASE("Corrupt chain keeps the pending journal") {
        TestLedger t("integration_corrupt");
        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
            REQUIRE(ledger.createAccount("B").is_ok());
            REQUIRE(ledger.settle("A").is_ok());
            REQUIRE(ledger.addTransaction("A", "B", 5).is_ok());
            REQUIRE(ledger.addTransaction("A", "B", 7).is_ok());
        }

        // Flip one character of the stored block hash
        const auto segment = std::filesystem::path(t.path) / "data-0";
        std::string line;
        {
            std::ifstream in(segment);
            REQUIRE(std::getline(in, line));
        }
        const std::string field = "\"hash\": \"";
        const size_t at = line.find(field);
        REQUIRE(at != std::string::npos);
        char &digit = line[at + field.size()];
        digit = digit == '0' ? '1' : '0';
        std::ofstream(segment, std::ios::trunc) << line << "\n";

        Minichain reopened(t.options);
        auto opened = reopened.open(t.path);
        REQUIRE_FALSE(opened.is_ok());
        CHECK(opened.error().code == ERR_CORRUPT_SEGMENT);
        CHECK_FALSE(reopened.isInitialized());
        CHECK(countLines(std::filesystem::path(t.path) / "transactions") == 2);
    }

    TEST_CASE("Stored segment threshold overrides options") {
        TestLedger t("integration_threshold");
        {
            Minichain ledger(t.options);
            REQUIRE(ledger.open(t.path).is_ok());
            REQUIRE(ledger.initialize("A").is_ok());
            for (int i = 0; i < 3; i++)
                REQUIRE(ledger.settle("A").is_ok());
        }

        Options wider = t.options;
        wider.segment_threshold = 100;
        Minichain reopened(wider);
        REQUIRE(reopened.open(t.path).is_ok());
        CHECK(reopened.options().segment_threshold == t.options.segment_threshold);

        REQUIRE(reopened.settle("A").is_ok());
        CHECK(countLines(std::filesystem::path(t.path) / "data-1") == 2);
        CHECK_FALSE(std::filesystem::exists(std::filesystem::path(t.path) / "data-2"));
    }
}
