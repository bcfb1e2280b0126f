/**
 * OpusCodec.hpp - libopus encoder / decoder wrappers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace xvc::audio {

class OpusEncoder {
public:
    OpusEncoder(int sample_rate, int channels, int frame_ms);
    ~OpusEncoder();

    OpusEncoder(const OpusEncoder&) = delete;
    OpusEncoder& operator=(const OpusEncoder&) = delete;

    bool isReady() const;

    /**
     * Encode exactly one frame (frameSamples() samples per channel).
     * @return nullopt on size mismatch or encoder error
     */
    std::optional<std::vector<uint8_t>> encode(const int16_t* pcm, size_t samples);

    void setComplexity(int complexity);
    void reset();

    size_t frameSamples() const;
    int sampleRate() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

class OpusDecoder {
public:
    OpusDecoder(int sample_rate, int channels, int frame_ms);
    ~OpusDecoder();

    OpusDecoder(const OpusDecoder&) = delete;
    OpusDecoder& operator=(const OpusDecoder&) = delete;

    bool isReady() const;

    /** @return decoded PCM, or nullopt if the packet is corrupt */
    std::optional<std::vector<int16_t>> decode(const std::vector<uint8_t>& packet);

    void reset();

    int sampleRate() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace xvc::audio
