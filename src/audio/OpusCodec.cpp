/**
 * OpusCodec.cpp - PCM <-> Opus using libopus
 */

#include "xvc/audio/OpusCodec.hpp"

#include <opus/opus.h>
#include <iostream>

namespace xvc::audio {

namespace {
constexpr int kMaxPacketBytes = 4000;
constexpr int kMaxFrameMs = 120;
}

// Encoder

struct OpusEncoder::Impl {
    ::OpusEncoder* enc = nullptr;
    int sample_rate = 16000;
    int channels = 1;
    size_t frame_samples = 0;
};

OpusEncoder::OpusEncoder(int sample_rate, int channels, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->channels = channels;
    pImpl_->frame_samples = static_cast<size_t>(sample_rate * frame_ms / 1000);

    int err = OPUS_OK;
    pImpl_->enc = opus_encoder_create(sample_rate, channels, OPUS_APPLICATION_VOIP, &err);
    if (err != OPUS_OK || !pImpl_->enc) {
        std::cerr << "[Opus] Encoder create failed: " << opus_strerror(err) << std::endl;
        pImpl_->enc = nullptr;
        return;
    }

    opus_encoder_ctl(pImpl_->enc, OPUS_SET_DTX(1));
    opus_encoder_ctl(pImpl_->enc, OPUS_SET_COMPLEXITY(3));
}

OpusEncoder::~OpusEncoder() {
    if (pImpl_->enc) {
        opus_encoder_destroy(pImpl_->enc);
    }
}

bool OpusEncoder::isReady() const {
    return pImpl_->enc != nullptr;
}

std::optional<std::vector<uint8_t>> OpusEncoder::encode(const int16_t* pcm, size_t samples) {
    if (!pImpl_->enc) return std::nullopt;

    if (samples != pImpl_->frame_samples) {
        std::cerr << "[Opus] Expected " << pImpl_->frame_samples << " samples, got " << samples << std::endl;
        return std::nullopt;
    }

    std::vector<uint8_t> packet(kMaxPacketBytes);
    opus_int32 bytes = opus_encode(pImpl_->enc, pcm, static_cast<int>(samples), packet.data(),
                                   static_cast<opus_int32>(packet.size()));
    if (bytes < 0) {
        std::cerr << "[Opus] Encode failed: " << opus_strerror(bytes) << std::endl;
        return std::nullopt;
    }

    packet.resize(static_cast<size_t>(bytes));
    return packet;
}

void OpusEncoder::setComplexity(int complexity) {
    if (pImpl_->enc) {
        opus_encoder_ctl(pImpl_->enc, OPUS_SET_COMPLEXITY(complexity));
    }
}

void OpusEncoder::reset() {
    if (pImpl_->enc) {
        opus_encoder_ctl(pImpl_->enc, OPUS_RESET_STATE);
    }
}

size_t OpusEncoder::frameSamples() const {
    return pImpl_->frame_samples;
}

int OpusEncoder::sampleRate() const {
    return pImpl_->sample_rate;
}

// Decoder

struct OpusDecoder::Impl {
    ::OpusDecoder* dec = nullptr;
    int sample_rate = 24000;
    int channels = 1;
    size_t max_samples = 0;
};

OpusDecoder::OpusDecoder(int sample_rate, int channels, int /*frame_ms*/)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->channels = channels;
    pImpl_->max_samples = static_cast<size_t>(sample_rate * kMaxFrameMs / 1000);

    int err = OPUS_OK;
    pImpl_->dec = opus_decoder_create(sample_rate, channels, &err);
    if (err != OPUS_OK || !pImpl_->dec) {
        std::cerr << "[Opus] Decoder create failed: " << opus_strerror(err) << std::endl;
        pImpl_->dec = nullptr;
    }
}

OpusDecoder::~OpusDecoder() {
    if (pImpl_->dec) {
        opus_decoder_destroy(pImpl_->dec);
    }
}

bool OpusDecoder::isReady() const {
    return pImpl_->dec != nullptr;
}

std::optional<std::vector<int16_t>> OpusDecoder::decode(const std::vector<uint8_t>& packet) {
    if (!pImpl_->dec || packet.empty()) return std::nullopt;

    std::vector<int16_t> pcm(pImpl_->max_samples * pImpl_->channels);
    int samples = opus_decode(pImpl_->dec, packet.data(), static_cast<opus_int32>(packet.size()), pcm.data(),
                              static_cast<int>(pImpl_->max_samples), 0);
    if (samples < 0) {
        std::cerr << "[Opus] Decode failed: " << opus_strerror(samples) << std::endl;
        return std::nullopt;
    }

    pcm.resize(static_cast<size_t>(samples) * pImpl_->channels);
    return pcm;
}

void OpusDecoder::reset() {
    if (pImpl_->dec) {
        opus_decoder_ctl(pImpl_->dec, OPUS_RESET_STATE);
    }
}

int OpusDecoder::sampleRate() const {
    return pImpl_->sample_rate;
}

} // namespace xvc::audio
