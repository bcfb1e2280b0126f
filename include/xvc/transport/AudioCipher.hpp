/**
 * AudioCipher.hpp - AES-128-CTR sealing of UDP audio packets (OpenSSL EVP)
 *
 * Packet layout: nonce(16) || ciphertext. The nonce is the server-provided
 * template with these fields overwritten (big endian):
 *   [2..3]   payload length
 *   [8..11]  timestamp
 *   [12..15] sequence
 * The whole nonce is the CTR initial counter block.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xvc::transport {

/** Decode a hex string; nullopt on odd length or non-hex characters. */
std::optional<std::vector<uint8_t>> hexDecode(const std::string& hex);

class AudioCipher {
public:
    static constexpr size_t kNonceSize = 16;
    static constexpr size_t kKeySize = 16;

    struct Packet {
        uint32_t sequence = 0;
        uint32_t timestamp = 0;
        std::vector<uint8_t> payload;
    };

    /** @return nullopt unless both key and nonce decode to 16 bytes */
    static std::optional<AudioCipher> create(const std::string& key_hex, const std::string& nonce_hex);

    std::optional<std::vector<uint8_t>> seal(const std::vector<uint8_t>& payload,
                                             uint32_t timestamp, uint32_t sequence) const;

    /** @return nullopt if the packet is short or its length field disagrees */
    std::optional<Packet> open(const uint8_t* data, size_t size) const;

private:
    AudioCipher() = default;

    std::vector<uint8_t> key_;
    std::vector<uint8_t> nonce_;
};

} // namespace xvc::transport
