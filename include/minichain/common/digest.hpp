#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace minichain {

    /// SHA-256 digest; empty on failure
    std::vector<uint8_t> sha256(const std::vector<uint8_t> &data);

    /// SHA-256 applied twice
    std::vector<uint8_t> doubleSha256(const std::vector<uint8_t> &data);

    /// RIPEMD-160 digest; empty on failure
    std::vector<uint8_t> ripemd160(const std::vector<uint8_t> &data);

    /// RIPEMD160(SHA256(data)); empty on failure
    std::vector<uint8_t> hash160(const std::vector<uint8_t> &data);

    /// Lowercase hex SHA-256 of a string; empty on failure
    std::string sha256Hex(const std::string &data);

    std::string toHex(const std::vector<uint8_t> &data);
    std::vector<uint8_t> fromHex(const std::string &hex);

    /// Hex form of the all-zero 32-byte digest, used as the genesis parent hash
    std::string zeroDigestHex();

    /// Number of leading zero bits in a hex-encoded digest
    uint32_t leadingZeroBits(const std::string &hex);

} // namespace minichain
