#include <minichain/common/serializer.hpp>
#include <minichain/ledger/transaction.hpp>
#include <sstream>

namespace minichain::ledger {

    std::string SignedMessage::toString() const { return payload + "|" + base58Encode(signature); }

    dp::Result<SignedMessage, dp::Error> SignedMessage::parse(const std::string &text) {
        // Base58 never contains '|' but account names inside the payload might
        size_t split = text.rfind('|');
        if (split == std::string::npos)
            return dp::Result<SignedMessage, dp::Error>::err(
                dp::Error::invalid_argument("Signed message has no signature separator"));

        SignedMessage message;
        message.payload = text.substr(0, split);
        try {
            message.signature = base58Decode(text.substr(split + 1));
        } catch (const std::exception &e) {
            return dp::Result<SignedMessage, dp::Error>::err(dp::Error::invalid_argument(dp::String(e.what())));
        }
        return dp::Result<SignedMessage, dp::Error>::ok(message);
    }

    std::string SignedTransaction::transferPayload(const std::string &source, const std::string &dest,
                                                   uint64_t amount) {
        return "from: " + source + " -- to: " + dest + " -- amount: " + std::to_string(amount);
    }

    std::string SignedTransaction::serialize() const {
        std::stringstream ss;
        ss << '{';
        ss << "\"source\": " << JsonSerializer::quote(source) << ", ";
        ss << "\"dest\": " << JsonSerializer::quote(dest) << ", ";
        ss << "\"amount\": " << amount;
        if (!signature.empty())
            ss << ", \"signature\": \"" << base58Encode(signature) << "\"";
        ss << '}';
        return ss.str();
    }

    dp::Result<SignedTransaction, dp::Error> SignedTransaction::deserialize(const std::string &data) {
        try {
            SignedTransaction tx;
            tx.source = JsonSerializer::extractString(data, "source");
            tx.dest = JsonSerializer::extractString(data, "dest");
            tx.amount = JsonSerializer::extractUint64(data, "amount");
            if (JsonSerializer::hasKey(data, "signature"))
                tx.signature = base58Decode(JsonSerializer::extractString(data, "signature"));
            return dp::Result<SignedTransaction, dp::Error>::ok(tx);
        } catch (const std::exception &e) {
            return dp::Result<SignedTransaction, dp::Error>::err(dp::Error::invalid_argument(dp::String(e.what())));
        }
    }

    std::string coinbasePayload(uint64_t subsidy, const std::string &miner) {
        return "Reward $" + std::to_string(subsidy) + " to " + miner;
    }

    std::optional<std::string> coinbaseMiner(const std::string &payload, uint64_t subsidy) {
        const std::string prefix = coinbasePayload(subsidy, "");
        if (payload.size() <= prefix.size() || payload.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;
        return payload.substr(prefix.size());
    }

    std::string genesisPayload() { return "This is the genesis block!!!"; }

} // namespace minichain::ledger
