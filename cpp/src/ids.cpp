#include "gitshort/ids.h"
#include "gitshort/error.h"
#include "gitshort/resolver.h"
#include "gitshort/types.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

namespace gitshort {

namespace {

const char* const ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int digit_value(char c) {
    const char* p = std::strchr(ALPHABET, c);
    if (!p || c == '\0') return -1;
    return static_cast<int>(p - ALPHABET);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// base58
// ---------------------------------------------------------------------------

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) ++zeros;

    // Big-endian base-58 digits; log(256)/log(58) < 1.38
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin();
             (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) out += ALPHABET[*it];
    return out;
}

std::vector<uint8_t> base58_decode(const std::string& text) {
    size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') ++ones;

    // log(58)/log(256) < 0.733
    std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = ones; i < text.size(); ++i) {
        int carry = digit_value(text[i]);
        if (carry < 0) throw InvalidIdError(text);
        size_t j = 0;
        for (auto it = bytes.rbegin();
             (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) ++it;

    std::vector<uint8_t> out(ones, 0);
    out.insert(out.end(), it, bytes.end());
    return out;
}

// ---------------------------------------------------------------------------
// hex
// ---------------------------------------------------------------------------

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0 || !is_hex(hex)) throw InvalidIdError(hex);
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((hex_value(hex[i]) << 4) |
                                           hex_value(hex[i + 1])));
    }
    return out;
}

bool is_hex(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(),
                       [](char c) { return hex_value(c) >= 0; });
}

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

std::string canonical_id(const std::string& commit_hex) {
    return base58_encode(hex_to_bytes(commit_hex));
}

std::string short_id(CommitResolver& resolver, const std::string& commit_hex) {
    // Whole bytes only: a half-byte prefix has no base58 form.
    for (size_t len = MIN_PREFIX_HEX; len <= commit_hex.size(); len += 2) {
        std::string prefix = commit_hex.substr(0, len);
        if (resolver.resolves_uniquely(prefix, commit_hex)) {
            return base58_encode(hex_to_bytes(prefix));
        }
    }
    // The full hash names exactly one object.
    return canonical_id(commit_hex);
}

std::string decode_id(const std::string& id) {
    if (id.empty()) throw InvalidIdError(id);
    return bytes_to_hex(base58_decode(id));
}

} // namespace gitshort
