/**
 * oino/encoding.hpp - Binary-to-text encodings: base64, base62, hex
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * base64 uses the OpenSSL block codec. base62 is a positional base-x
 * encoding over "0-9a-zA-Z": the byte string is read as one big-endian
 * number, and leading zero bytes survive as leading '0' symbols.
 */

#pragma once

#include "errors.hpp"
#include "str.hpp"
#include "types.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace oino {

// ============================================================================
// Base64
// ============================================================================

inline std::string base64_encode(const uint8_t* data, size_t size) {
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                            static_cast<int>(size));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

inline std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

inline Bytes base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean += c;
    }
    if (clean.empty()) return {};
    if (clean.size() % 4 != 0) {
        throw SerializationError("Invalid base64 length", clean.substr(0, 32));
    }
    Bytes out(clean.size() / 4 * 3 + 1);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) {
        throw SerializationError("Invalid base64 data", clean.substr(0, 32));
    }
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

// ============================================================================
// Base62
// ============================================================================

constexpr const char* kBase62Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

inline int base62_index(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 36;
    return -1;
}

namespace detail {

// Little-endian base-62 digits of the big-endian number in [begin, end).
inline std::vector<uint8_t> to_base62_digits(const uint8_t* begin, const uint8_t* end) {
    std::vector<uint8_t> digits;
    for (const uint8_t* p = begin; p != end; ++p) {
        unsigned carry = *p;
        for (auto& d : digits) {
            carry += static_cast<unsigned>(d) << 8;
            d = static_cast<uint8_t>(carry % 62);
            carry /= 62;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 62));
            carry /= 62;
        }
    }
    return digits;
}

// Little-endian bytes of the base-62 number in text[begin, end).
inline std::vector<uint8_t> from_base62_digits(const std::string& text, size_t begin, size_t end) {
    std::vector<uint8_t> bytes;
    for (size_t i = begin; i < end; ++i) {
        int value = base62_index(text[i]);
        if (value < 0) {
            throw SerializationError("Invalid base62 character", text.substr(i, 1));
        }
        unsigned carry = static_cast<unsigned>(value);
        for (auto& b : bytes) {
            carry += static_cast<unsigned>(b) * 62;
            b = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }
    return bytes;
}

} // namespace detail

inline std::string base62_encode(const Bytes& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;
    auto digits = detail::to_base62_digits(data.data() + zeros, data.data() + data.size());
    std::string out(zeros, kBase62Alphabet[0]);
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out += kBase62Alphabet[*it];
    }
    return out;
}

inline Bytes base62_decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == kBase62Alphabet[0]) ++zeros;
    auto bytes = detail::from_base62_digits(text, zeros, text.size());
    Bytes out(zeros, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

/// Number of base62 symbols needed to hold any value of byte_count bytes.
inline size_t base62_fixed_width(size_t byte_count) {
    // 62^k >= 256^n  <=>  k >= n * log(256) / log(62)
    size_t width = 0;
    double capacity = 0.0;
    while (capacity < static_cast<double>(byte_count) * 8.0) {
        capacity += 5.954196310386876;  // log2(62)
        ++width;
    }
    return width;
}

/// Encode into exactly base62_fixed_width(data.size()) symbols.
inline std::string base62_encode_fixed(const Bytes& data) {
    auto digits = detail::to_base62_digits(data.data(), data.data() + data.size());
    size_t width = base62_fixed_width(data.size());
    std::string out(width - std::min(width, digits.size()), kBase62Alphabet[0]);
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out += kBase62Alphabet[*it];
    }
    return out;
}

inline Bytes base62_decode_fixed(const std::string& text, size_t byte_count) {
    auto bytes = detail::from_base62_digits(text, 0, text.size());
    if (bytes.size() > byte_count) {
        throw SerializationError("base62 value too large", text);
    }
    Bytes out(byte_count - bytes.size(), 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

// ============================================================================
// Hex
// ============================================================================

inline std::string hex_encode(const Bytes& data, bool upper = false) {
    const char* digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

inline Bytes hex_decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw SerializationError("Odd length hex string", text);
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_digit(text[i]);
        int lo = hex_digit(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw SerializationError("Invalid hex string", text);
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace oino
