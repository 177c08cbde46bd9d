/**
 * Example: Running a minichain ledger against a directory
 *
 * This demo shows how to:
 * 1. Open a ledger directory and initialize it with a genesis miner
 * 2. Register accounts and queue signed transfers
 * 3. Settle full batches into sealed blocks
 * 4. Reopen the directory and verify what was stored
 */

#include <filesystem>
#include <iostream>
#include <minichain.hpp>
#include <random>
#include <string>

using namespace minichain;

namespace {

    constexpr size_t BATCH_SIZE = 100;
    constexpr int ACCOUNT_COUNT = 10;
    constexpr int TRANSFER_COUNT = 200;
    constexpr uint64_t TRANSFER_AMOUNT = 80;

    const std::string MINER = "Eric Chen";

    void printError(const std::string &what, const dp::Error &error) {
        std::cerr << what << " failed: " << error.message.c_str() << " (code " << error.code << ")" << std::endl;
    }

} // namespace

int main(int argc, char **argv) {
    const std::string path = argc > 1 ? argv[1] : "minichain_data";

    Options options;
    options.difficulty_bits = 12;

    std::cout << "=== minichain ledger demo ===" << std::endl;
    std::cout << "Directory: " << std::filesystem::absolute(path).string() << std::endl << std::endl;

    // ===========================================
    // Step 1: Open and initialize
    // ===========================================
    {
        Minichain ledger(options);
        auto opened = ledger.open(path);
        if (!opened.is_ok()) {
            printError("Open", opened.error());
            return 1;
        }

        if (!ledger.isInitialized()) {
            auto genesis = ledger.initialize(MINER);
            if (!genesis.is_ok()) {
                printError("Initialize", genesis.error());
                return 1;
            }
            std::cout << "Genesis hash: " << genesis.value().hash << std::endl;

            auto funded = ledger.vault().credit(MINER, 1000000);
            if (!funded.is_ok()) {
                printError("Funding", funded.error());
                return 1;
            }
            auto saved = ledger.persistAll();
            if (!saved.is_ok()) {
                printError("Persist", saved.error());
                return 1;
            }
        }

        // ===========================================
        // Step 2: Accounts and transfers
        // ===========================================
        for (int i = 1; i <= ACCOUNT_COUNT; i++) {
            std::string name = "my address " + std::to_string(i);
            if (ledger.vault().hasAccount(name))
                continue;
            auto account = ledger.createAccount(name);
            if (!account.is_ok()) {
                printError("Create account", account.error());
                return 1;
            }
            std::cout << "Created " << name << " -> " << account.value().address() << std::endl;
        }

        std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> pick(1, ACCOUNT_COUNT);

        // ===========================================
        // Step 3: Settle full batches
        // ===========================================
        for (int i = 0; i < TRANSFER_COUNT; i++) {
            if (ledger.pool().pendingCount() >= BATCH_SIZE) {
                auto block = ledger.settle(MINER);
                if (!block.is_ok()) {
                    printError("Settle", block.error());
                    return 1;
                }
            }

            std::string winner = "my address " + std::to_string(pick(rng));
            auto tx = ledger.addTransaction(MINER, winner, TRANSFER_AMOUNT);
            if (!tx.is_ok()) {
                printError("Transfer", tx.error());
                break;
            }
        }
        if (ledger.pool().pendingCount() >= BATCH_SIZE) {
            auto block = ledger.settle(MINER);
            if (!block.is_ok()) {
                printError("Settle", block.error());
                return 1;
            }
        }

        std::cout << std::endl << "Chain height: " << ledger.chain().size() << " blocks" << std::endl;
        std::cout << "Pending transfers: " << ledger.pool().pendingCount() << std::endl;
    }

    // ===========================================
    // Step 4: Reopen and verify
    // ===========================================
    Minichain reopened(options);
    auto opened = reopened.open(path);
    if (!opened.is_ok()) {
        printError("Reopen", opened.error());
        return 1;
    }

    auto verified = reopened.chain().verifyChain();
    if (!verified.is_ok()) {
        printError("Chain verification", verified.error());
        return 1;
    }
    std::cout << "Chain verified: " << reopened.chain().size() << " blocks" << std::endl;

    for (const auto &account : reopened.vault().accounts()) {
        std::cout << "  " << account.name() << ": " << account.balance()
                  << (identity::IdentityVault::verifyAddress(account) ? "" : " (address mismatch)") << std::endl;
    }
    std::cout << "Total balance: " << reopened.vault().totalBalance() << std::endl;

    return 0;
}
