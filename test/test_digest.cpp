#include <doctest/doctest.h>

#include <minichain/common/digest.hpp>
#include <minichain/common/serializer.hpp>
#include <cctype>
#include <string>

using namespace minichain;

static std::string lower(std::string hex) {
    for (auto &c : hex)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return hex;
}

TEST_SUITE("Digest Tests") {
    TEST_CASE("SHA-256 known vectors") {
        CHECK(lower(sha256Hex("")) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        CHECK(lower(sha256Hex("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        CHECK(sha256(stringToBytes("abc")).size() == 32);
    }

    TEST_CASE("RIPEMD-160 and hash160") {
        CHECK(lower(toHex(ripemd160(stringToBytes("")))) == "9c1185a5c5e9fc54612808977ee8f548b2258d31");
        CHECK(lower(toHex(ripemd160(stringToBytes("abc")))) == "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");

        auto data = stringToBytes("verifying key");
        CHECK(hash160(data) == ripemd160(sha256(data)));
        CHECK(hash160(data).size() == 20);
        CHECK(doubleSha256(data) == sha256(sha256(data)));
    }

    TEST_CASE("Hex helpers") {
        std::vector<uint8_t> bytes = {0x00, 0x0f, 0xa0, 0xff};
        CHECK(lower(toHex(bytes)) == "000fa0ff");
        CHECK(fromHex("000fa0ff") == bytes);
        CHECK(zeroDigestHex() == std::string(64, '0'));
    }

    TEST_CASE("Leading zero bits") {
        CHECK(leadingZeroBits("ffff") == 0);
        CHECK(leadingZeroBits("7fff") == 1);
        CHECK(leadingZeroBits("0fff") == 4);
        CHECK(leadingZeroBits("00ff") == 8);
        CHECK(leadingZeroBits("001f") == 11);
        CHECK(leadingZeroBits(zeroDigestHex()) == 256);
    }
}
