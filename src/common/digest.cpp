#include <keylock/keylock.hpp>
#include <minichain/common/digest.hpp>
#include <openssl/evp.h>

namespace minichain {

    std::vector<uint8_t> sha256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success)
            return {};
        return std::vector<uint8_t>(result.data.begin(), result.data.end());
    }

    std::vector<uint8_t> doubleSha256(const std::vector<uint8_t> &data) {
        auto first = sha256(data);
        if (first.empty())
            return {};
        return sha256(first);
    }

    std::vector<uint8_t> ripemd160(const std::vector<uint8_t> &data) {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int out_len = 0;
        if (EVP_Digest(data.data(), data.size(), out, &out_len, EVP_ripemd160(), nullptr) != 1)
            return {};
        return std::vector<uint8_t>(out, out + out_len);
    }

    std::vector<uint8_t> hash160(const std::vector<uint8_t> &data) {
        auto sha = sha256(data);
        if (sha.empty())
            return {};
        return ripemd160(sha);
    }

    std::string sha256Hex(const std::string &data) {
        auto digest = sha256(std::vector<uint8_t>(data.begin(), data.end()));
        if (digest.empty())
            return "";
        return toHex(digest);
    }

    std::string toHex(const std::vector<uint8_t> &data) { return keylock::keylock::to_hex(data); }

    std::vector<uint8_t> fromHex(const std::string &hex) { return keylock::keylock::from_hex(hex); }

    std::string zeroDigestHex() { return std::string(64, '0'); }

    uint32_t leadingZeroBits(const std::string &hex) {
        uint32_t bits = 0;
        for (char c : hex) {
            int nibble;
            if (c >= '0' && c <= '9')
                nibble = c - '0';
            else if (c >= 'a' && c <= 'f')
                nibble = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F')
                nibble = c - 'A' + 10;
            else
                return bits;

            if (nibble == 0) {
                bits += 4;
                continue;
            }
            // Count the zero bits at the top of this nibble and stop
            for (int mask = 0x8; mask > 0 && (nibble & mask) == 0; mask >>= 1)
                bits++;
            return bits;
        }
        return bits;
    }

} // namespace minichain
