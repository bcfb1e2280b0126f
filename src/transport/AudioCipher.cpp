/**
 * AudioCipher.cpp - AES-128-CTR over OpenSSL EVP
 */

#include "xvc/transport/AudioCipher.hpp"

#include <openssl/evp.h>

#include <iostream>
#include <memory>

namespace xvc::transport {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void putU16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

void putU32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t getU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// CTR mode: encryption and decryption are the same keystream XOR
std::optional<std::vector<uint8_t>> ctr(const std::vector<uint8_t>& key, const uint8_t* iv,
                                        const uint8_t* in, size_t size) {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) return std::nullopt;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(), iv) != 1) {
        std::cerr << "[AudioCipher] EVP init failed" << std::endl;
        return std::nullopt;
    }

    std::vector<uint8_t> out(size + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, in, static_cast<int>(size)) != 1) {
        std::cerr << "[AudioCipher] EVP update failed" << std::endl;
        return std::nullopt;
    }

    int tail = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &tail) != 1) {
        std::cerr << "[AudioCipher] EVP final failed" << std::endl;
        return std::nullopt;
    }

    out.resize(static_cast<size_t>(len + tail));
    return out;
}

} // namespace

std::optional<std::vector<uint8_t>> hexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::optional<AudioCipher> AudioCipher::create(const std::string& key_hex, const std::string& nonce_hex) {
    auto key = hexDecode(key_hex);
    auto nonce = hexDecode(nonce_hex);
    if (!key || key->size() != kKeySize || !nonce || nonce->size() != kNonceSize) {
        std::cerr << "[AudioCipher] Key and nonce must be 16 bytes of hex" << std::endl;
        return std::nullopt;
    }

    AudioCipher cipher;
    cipher.key_ = std::move(*key);
    cipher.nonce_ = std::move(*nonce);
    return cipher;
}

std::optional<std::vector<uint8_t>> AudioCipher::seal(const std::vector<uint8_t>& payload,
                                                      uint32_t timestamp, uint32_t sequence) const {
    if (payload.size() > 0xFFFF) return std::nullopt;

    std::vector<uint8_t> nonce = nonce_;
    putU16(nonce.data() + 2, static_cast<uint16_t>(payload.size()));
    putU32(nonce.data() + 8, timestamp);
    putU32(nonce.data() + 12, sequence);

    auto body = ctr(key_, nonce.data(), payload.data(), payload.size());
    if (!body) return std::nullopt;

    nonce.insert(nonce.end(), body->begin(), body->end());
    return nonce;
}

std::optional<AudioCipher::Packet> AudioCipher::open(const uint8_t* data, size_t size) const {
    if (size < kNonceSize) return std::nullopt;

    size_t length = getU16(data + 2);
    if (length != size - kNonceSize) return std::nullopt;

    auto body = ctr(key_, data, data + kNonceSize, length);
    if (!body) return std::nullopt;

    Packet packet;
    packet.timestamp = getU32(data + 8);
    packet.sequence = getU32(data + 12);
    packet.payload = std::move(*body);
    return packet;
}

} // namespace xvc::transport
