/**
 * oino/id_codec.hpp - Authenticated obfuscation of numeric primary keys
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * A token is  iv_seed || base62(ciphertext) || base62(tag)  where
 *
 *   iv_seed  ceil(min_length / 2) base62 characters, either derived from
 *            HMAC-SHA256(key, domain + " " + cell_seed) (static ids) or
 *            drawn from RAND_bytes
 *   iv       first 16 bytes of HMAC-SHA256(key, domain + " " + iv_seed)
 *   cipher   AES-128-GCM over the id, padded with " " and filler up to
 *            the iv_seed length
 *   tag      the 16 byte GCM tag as exactly 22 base62 characters
 *
 * Example:
 *
 *   oino::IdCodec ids("000102030405060708090a0b0c0d0e0f", "shop", 12, true);
 *   std::string token = ids.encode("42", "id 42");
 *   std::string id = ids.decode(token);   // "42"
 */

#pragma once

#include "encoding.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <memory>
#include <string>

namespace oino {

class IdCodec {
public:
    static constexpr int kMinLength = 12;
    static constexpr int kMaxLength = 42;
    static constexpr size_t kKeySize = 16;
    static constexpr size_t kIvSize = 16;
    static constexpr size_t kTagSize = 16;
    static constexpr char kPadSeparator = ' ';

    /**
     * @param key_hex     32 hex characters (AES-128 and HMAC key)
     * @param domain_id   mixed into every derivation, e.g. the database name
     * @param min_length  minimum token length in [12, 42]
     * @param static_ids  same input always gives the same token
     * @throws CryptoConfigError on a bad key or length
     */
    IdCodec(const std::string& key_hex, std::string domain_id,
            int min_length = kMinLength, bool static_ids = false)
        : domain_id_(std::move(domain_id)),
          min_length_(min_length),
          static_ids_(static_ids) {
        if (key_hex.size() != kKeySize * 2) {
            throw CryptoConfigError("Id key must be 32 hex characters");
        }
        try {
            key_ = hex_decode(key_hex);
        } catch (const SerializationError&) {
            throw CryptoConfigError("Id key must be 32 hex characters");
        }
        if (min_length < kMinLength || min_length > kMaxLength) {
            throw CryptoConfigError("Id length must be between 12 and 42, got " +
                                    std::to_string(min_length));
        }
        seed_length_ = static_cast<size_t>((min_length + 1) / 2);
    }

    int min_length() const { return min_length_; }
    bool static_ids() const { return static_ids_; }
    const std::string& domain_id() const { return domain_id_; }

    /// @throws InvalidIdError if the id contains the padding separator
    std::string encode(const std::string& id, const std::string& cell_seed) const {
        if (id.find(kPadSeparator) != std::string::npos) {
            throw InvalidIdError("Id must not contain a space", id);
        }
        std::string iv_seed;
        if (static_ids_) {
            iv_seed = base62_encode(hmac(domain_id_ + " " + cell_seed)).substr(0, seed_length_);
        } else {
            iv_seed = random_chars(seed_length_);
        }

        std::string plaintext = id;
        if (plaintext.size() < seed_length_) {
            size_t filler = seed_length_ - plaintext.size() - 1;
            plaintext += kPadSeparator + iv_seed.substr(iv_seed.size() - filler);
        }

        Bytes tag(kTagSize);
        Bytes ciphertext = encrypt(plaintext, derive_iv(iv_seed), tag);
        return iv_seed + base62_encode(ciphertext) + base62_encode_fixed(tag);
    }

    /// @throws CryptoIntegrityError if the token is malformed or was altered
    std::string decode(const std::string& token) const {
        const size_t tag_width = base62_fixed_width(kTagSize);
        if (token.size() <= seed_length_ + tag_width) {
            throw CryptoIntegrityError("Malformed id token");
        }
        const std::string iv_seed = token.substr(0, seed_length_);
        for (char c : iv_seed) {
            if (base62_index(c) < 0) throw CryptoIntegrityError("Malformed id token");
        }
        Bytes ciphertext;
        Bytes tag;
        try {
            ciphertext = base62_decode(token.substr(seed_length_, token.size() - seed_length_ - tag_width));
            tag = base62_decode_fixed(token.substr(token.size() - tag_width), kTagSize);
        } catch (const SerializationError&) {
            throw CryptoIntegrityError("Malformed id token");
        }

        std::string plaintext = decrypt(ciphertext, derive_iv(iv_seed), tag);
        return plaintext.substr(0, plaintext.find(kPadSeparator));
    }

private:
    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    Bytes key_;
    std::string domain_id_;
    int min_length_;
    bool static_ids_;
    size_t seed_length_ = 0;

    Bytes hmac(const std::string& message) const {
        Bytes out(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (!HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()),
                  reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                  out.data(), &len)) {
            throw Error("HMAC-SHA256 failed");
        }
        out.resize(len);
        return out;
    }

    Bytes derive_iv(const std::string& iv_seed) const {
        Bytes digest = hmac(domain_id_ + " " + iv_seed);
        return Bytes(digest.begin(), digest.begin() + kIvSize);
    }

    // Uniform base62 characters; bytes >= 248 are rejected to avoid modulo bias
    static std::string random_chars(size_t count) {
        std::string out;
        unsigned char buf[64];
        while (out.size() < count) {
            if (RAND_bytes(buf, sizeof(buf)) != 1) {
                throw Error("RAND_bytes failed");
            }
            for (unsigned char b : buf) {
                if (b < 248 && out.size() < count) out += kBase62Alphabet[b % 62];
            }
        }
        return out;
    }

    Bytes encrypt(const std::string& plaintext, const Bytes& iv, Bytes& tag) const {
        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx ||
            EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
            throw Error("AES-128-GCM init failed");
        }
        Bytes out(plaintext.size() + kTagSize);
        int len = 0;
        int total = 0;
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw Error("AES-128-GCM encrypt failed");
        }
        total = len;
        if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
            throw Error("AES-128-GCM finalize failed");
        }
        total += len;
        out.resize(static_cast<size_t>(total));
        return out;
    }

    std::string decrypt(const Bytes& ciphertext, const Bytes& iv, Bytes& tag) const {
        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx ||
            EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
            throw Error("AES-128-GCM init failed");
        }
        std::string out(ciphertext.size() + kTagSize, '\0');
        int len = 0;
        int total = 0;
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            throw CryptoIntegrityError("Id token decryption failed");
        }
        total = len;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1 ||
            EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]) + total, &len) <= 0) {
            throw CryptoIntegrityError("Id token authentication failed");
        }
        total += len;
        out.resize(static_cast<size_t>(total));
        return out;
    }
};

} // namespace oino
