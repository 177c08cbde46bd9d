#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace minichain {

    inline std::vector<uint8_t> stringToBytes(const std::string &str) { return {str.begin(), str.end()}; }
    inline std::string bytesToString(const std::vector<uint8_t> &vec) { return {vec.begin(), vec.end()}; }

    // ===========================================
    // Base64 (account key fields)
    // ===========================================

    inline std::string base64Encode(const std::vector<uint8_t> &data) {
        const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string encoded;
        for (size_t i = 0; i < data.size(); i += 3) {
            uint32_t temp = 0;
            for (size_t j = 0; j < 3; ++j) {
                temp <<= 8;
                if (i + j < data.size())
                    temp |= data[i + j];
            }
            for (int k = 3; k >= 0; --k)
                encoded += chars[(temp >> (6 * k)) & 0x3F];
        }
        size_t pad = data.size() % 3;
        if (pad)
            for (size_t i = 0; i < 3 - pad; ++i)
                encoded[encoded.length() - 1 - i] = '=';
        return encoded;
    }

    /// Decode base64; throws on characters outside the alphabet
    inline std::vector<uint8_t> base64Decode(const std::string &encoded) {
        const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::vector<uint8_t> decoded;
        std::string cleanInput = encoded;
        while (!cleanInput.empty() && cleanInput.back() == '=')
            cleanInput.pop_back();
        for (size_t i = 0; i < cleanInput.size(); i += 4) {
            uint32_t temp = 0;
            int validChars = 0;
            for (size_t j = 0; j < 4 && i + j < cleanInput.size(); ++j) {
                size_t pos = chars.find(cleanInput[i + j]);
                if (pos == std::string::npos)
                    throw std::runtime_error("Invalid base64 character");
                temp |= static_cast<uint32_t>(pos) << (6 * (3 - j));
                validChars++;
            }
            if (validChars >= 2)
                decoded.push_back((temp >> 16) & 0xFF);
            if (validChars >= 3)
                decoded.push_back((temp >> 8) & 0xFF);
            if (validChars >= 4)
                decoded.push_back(temp & 0xFF);
        }
        return decoded;
    }

    // ===========================================
    // Base58 (Bitcoin alphabet; addresses and signatures)
    // ===========================================

    inline const char *base58Alphabet() { return "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"; }

    inline std::string base58Encode(const std::vector<uint8_t> &input) {
        const char *ALPHABET = base58Alphabet();
        std::string result;

        // Count leading zeros
        size_t leading_zeros = 0;
        for (auto b : input) {
            if (b == 0)
                leading_zeros++;
            else
                break;
        }

        // Digits are little-endian base58
        std::vector<uint8_t> digits;
        for (uint8_t byte : input) {
            int carry = byte;
            for (auto &digit : digits) {
                carry += digit * 256;
                digit = carry % 58;
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(carry % 58);
                carry /= 58;
            }
        }

        for (size_t i = 0; i < leading_zeros; i++) {
            result += '1';
        }
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            result += ALPHABET[*it];
        }
        return result;
    }

    /// Decode base58; throws on characters outside the alphabet
    inline std::vector<uint8_t> base58Decode(const std::string &input) {
        const std::string alphabet = base58Alphabet();

        size_t leading_ones = 0;
        for (char c : input) {
            if (c == '1')
                leading_ones++;
            else
                break;
        }

        // Bytes are little-endian base256
        std::vector<uint8_t> bytes;
        for (char c : input) {
            size_t pos = alphabet.find(c);
            if (pos == std::string::npos)
                throw std::runtime_error("Invalid base58 character");
            int carry = static_cast<int>(pos);
            for (auto &byte : bytes) {
                carry += byte * 58;
                byte = carry & 0xFF;
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(carry & 0xFF);
                carry >>= 8;
            }
        }

        std::vector<uint8_t> result(leading_ones, 0);
        result.insert(result.end(), bytes.rbegin(), bytes.rend());
        return result;
    }

    // ===========================================
    // JSON utilities for flat line records
    // ===========================================

    class JsonSerializer {
      public:
        static std::string escapeJson(const std::string &str) {
            std::string result;
            for (char c : str) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        const char *hex = "0123456789abcdef";
                        result += "\\u00";
                        result += hex[(c >> 4) & 0x0F];
                        result += hex[c & 0x0F];
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        static std::string quote(const std::string &str) { return "\"" + escapeJson(str) + "\""; }

        /// Raw text of the value stored under a top-level key (strings keep their quotes)
        static std::string extractJsonValue(const std::string &json, const std::string &key) {
            size_t pos = 0;
            skipWhitespace(json, pos);
            expect(json, pos, '{');
            skipWhitespace(json, pos);
            if (pos < json.size() && json[pos] == '}')
                throw std::runtime_error("Key not found: " + key);

            while (pos < json.size()) {
                skipWhitespace(json, pos);
                std::string name = readString(json, pos);
                skipWhitespace(json, pos);
                expect(json, pos, ':');
                skipWhitespace(json, pos);
                size_t start = pos;
                skipValue(json, pos);
                if (name == key)
                    return json.substr(start, pos - start);
                skipWhitespace(json, pos);
                if (pos < json.size() && json[pos] == ',') {
                    pos++;
                    continue;
                }
                expect(json, pos, '}');
                break;
            }
            throw std::runtime_error("Key not found: " + key);
        }

        static bool hasKey(const std::string &json, const std::string &key) {
            try {
                extractJsonValue(json, key);
                return true;
            } catch (const std::runtime_error &) {
                return false;
            }
        }

        static std::string extractString(const std::string &json, const std::string &key) {
            std::string raw = extractJsonValue(json, key);
            size_t pos = 0;
            return readString(raw, pos);
        }

        static uint64_t extractUint64(const std::string &json, const std::string &key) {
            std::string raw = extractJsonValue(json, key);
            if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos)
                throw std::runtime_error("Expected unsigned integer for key: " + key);
            return std::stoull(raw);
        }

        static int64_t extractInt64(const std::string &json, const std::string &key) {
            std::string raw = extractJsonValue(json, key);
            size_t digits = (!raw.empty() && raw[0] == '-') ? 1 : 0;
            if (raw.size() == digits || raw.find_first_not_of("0123456789", digits) != std::string::npos)
                throw std::runtime_error("Expected integer for key: " + key);
            return std::stoll(raw);
        }

        static std::vector<std::string> extractStringArray(const std::string &json, const std::string &key) {
            std::string raw = extractJsonValue(json, key);
            std::vector<std::string> items;
            size_t pos = 0;
            expect(raw, pos, '[');
            skipWhitespace(raw, pos);
            if (pos < raw.size() && raw[pos] == ']')
                return items;
            while (pos < raw.size()) {
                skipWhitespace(raw, pos);
                items.push_back(readString(raw, pos));
                skipWhitespace(raw, pos);
                if (pos < raw.size() && raw[pos] == ',') {
                    pos++;
                    continue;
                }
                expect(raw, pos, ']');
                return items;
            }
            throw std::runtime_error("Unterminated array for key: " + key);
        }

      private:
        static void skipWhitespace(const std::string &json, size_t &pos) {
            while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r'))
                pos++;
        }

        static void expect(const std::string &json, size_t &pos, char c) {
            if (pos >= json.size() || json[pos] != c)
                throw std::runtime_error(std::string("Malformed JSON: expected '") + c + "'");
            pos++;
        }

        static void appendUtf8(std::string &out, uint32_t cp) {
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        /// Read a quoted string starting at pos, unescaping it
        static std::string readString(const std::string &json, size_t &pos) {
            expect(json, pos, '"');
            std::string result;
            while (pos < json.size()) {
                char c = json[pos++];
                if (c == '"')
                    return result;
                if (c != '\\') {
                    result += c;
                    continue;
                }
                if (pos >= json.size())
                    break;
                char e = json[pos++];
                switch (e) {
                case '"':
                    result += '"';
                    break;
                case '\\':
                    result += '\\';
                    break;
                case '/':
                    result += '/';
                    break;
                case 'n':
                    result += '\n';
                    break;
                case 'r':
                    result += '\r';
                    break;
                case 't':
                    result += '\t';
                    break;
                case 'b':
                    result += '\b';
                    break;
                case 'f':
                    result += '\f';
                    break;
                case 'u': {
                    if (pos + 4 > json.size())
                        throw std::runtime_error("Malformed JSON: truncated unicode escape");
                    uint32_t cp = static_cast<uint32_t>(std::stoul(json.substr(pos, 4), nullptr, 16));
                    pos += 4;
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    throw std::runtime_error("Malformed JSON: bad escape");
                }
            }
            throw std::runtime_error("Malformed JSON: unterminated string");
        }

        static void skipValue(const std::string &json, size_t &pos) {
            if (pos >= json.size())
                throw std::runtime_error("Malformed JSON: missing value");
            char c = json[pos];
            if (c == '"') {
                readString(json, pos);
                return;
            }
            if (c == '{' || c == '[') {
                int depth = 0;
                while (pos < json.size()) {
                    char d = json[pos];
                    if (d == '"') {
                        readString(json, pos);
                        continue;
                    }
                    if (d == '{' || d == '[')
                        depth++;
                    else if (d == '}' || d == ']')
                        depth--;
                    pos++;
                    if (depth == 0)
                        return;
                }
                throw std::runtime_error("Malformed JSON: unbalanced brackets");
            }
            size_t end = json.find_first_of(",}] \t\r\n", pos);
            if (end == pos)
                throw std::runtime_error("Malformed JSON: missing value");
            pos = (end == std::string::npos) ? json.size() : end;
        }
    };

} // namespace minichain
