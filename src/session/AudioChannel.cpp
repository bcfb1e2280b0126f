/**
 * AudioChannel.cpp - Audio channel state machine and frame gate
 */

#include "xvc/session/AudioChannel.hpp"

#include <iostream>

namespace xvc::session {

namespace {

constexpr uint64_t kDropLogInterval = 50;

bool shouldLogDrop(uint64_t count) {
    return count == 1 || count % kDropLogInterval == 0;
}

} // namespace

const char* channelStateName(ChannelState state) {
    switch (state) {
        case ChannelState::CLOSED: return "CLOSED";
        case ChannelState::OPENING: return "OPENING";
        case ChannelState::OPENED: return "OPENED";
        case ChannelState::RECORDING: return "RECORDING";
        case ChannelState::PROCESSING: return "PROCESSING";
        case ChannelState::PLAYING: return "PLAYING";
        case ChannelState::CLOSING: return "CLOSING";
    }
    return "?";
}

AudioChannel::AudioChannel(transport::Transport& transport) : transport_(transport) {}

AudioChannel::~AudioChannel() {
    if (state_.load() != ChannelState::CLOSED) {
        std::cerr << "[AudioChannel] Destroyed in state " << channelStateName(state_.load())
                  << " (session " << session_id_ << ")" << std::endl;
    }
}

void AudioChannel::setState(ChannelState to) {
    ChannelState from = state_.load();
    if (from == ChannelState::RECORDING && to != ChannelState::RECORDING) {
        std::lock_guard<std::mutex> gate(send_gate_);
        state_ = to;
    } else {
        state_ = to;
    }
    std::cout << "[AudioChannel] " << channelStateName(from) << " -> " << channelStateName(to) << std::endl;
}

bool AudioChannel::transition(ChannelState from, ChannelState to) {
    if (state_.load() != from) {
        std::cerr << "[AudioChannel] Rejected " << channelStateName(state_.load()) << " -> "
                  << channelStateName(to) << std::endl;
        return false;
    }
    setState(to);
    return true;
}

bool AudioChannel::open(const protocol::Identity& identity, const protocol::AudioParams& params) {
    if (!transition(ChannelState::CLOSED, ChannelState::OPENING)) return false;

    if (!transport_.sendControlMessage(protocol::makeHello(identity, transport_.name(), params))) {
        std::cerr << "[AudioChannel] Failed to send hello" << std::endl;
        return false;
    }
    return true;
}

bool AudioChannel::onHelloAck(const std::string& session_id) {
    if (state_.load() != ChannelState::OPENING) {
        std::cerr << "[AudioChannel] Unexpected hello_ack in " << channelStateName(state_.load()) << std::endl;
        return false;
    }
    if (!session_id_.empty()) {
        std::cerr << "[AudioChannel] Duplicate hello_ack ignored" << std::endl;
        return false;
    }

    session_id_ = session_id;
    std::cout << "[AudioChannel] Session " << session_id_ << " assigned" << std::endl;

    if (!transport_.sendControlMessage(protocol::makeStartAudio(session_id_))) {
        std::cerr << "[AudioChannel] Failed to send start_audio" << std::endl;
        return false;
    }
    return true;
}

bool AudioChannel::onOpened() {
    if (session_id_.empty()) {
        std::cerr << "[AudioChannel] audio_channel_opened before hello_ack" << std::endl;
        return false;
    }
    return transition(ChannelState::OPENING, ChannelState::OPENED);
}

bool AudioChannel::startRecording() {
    ChannelState current = state_.load();
    if (current != ChannelState::OPENED && current != ChannelState::PROCESSING &&
        current != ChannelState::PLAYING) {
        std::cerr << "[AudioChannel] Cannot record from " << channelStateName(current) << std::endl;
        return false;
    }
    setState(ChannelState::RECORDING);
    return true;
}

bool AudioChannel::endOfSpeech() {
    return transition(ChannelState::RECORDING, ChannelState::PROCESSING);
}

bool AudioChannel::startPlaying() {
    return transition(ChannelState::PROCESSING, ChannelState::PLAYING);
}

bool AudioChannel::close() {
    ChannelState current = state_.load();
    if (current == ChannelState::CLOSED || current == ChannelState::CLOSING) {
        return false;
    }
    setState(ChannelState::CLOSING);

    if (!session_id_.empty() && transport_.isConnected()) {
        if (!transport_.sendControlMessage(protocol::makeStopAudio(session_id_))) {
            std::cerr << "[AudioChannel] Failed to send stop_audio" << std::endl;
        }
    }
    return true;
}

bool AudioChannel::onClosed() {
    if (!transition(ChannelState::CLOSING, ChannelState::CLOSED)) return false;

    std::cout << "[AudioChannel] Closed (sent=" << sent_seq_ << ", received=" << recv_seq_
              << ", dropped out=" << dropped_outbound_ << ", dropped in=" << dropped_inbound_
              << ")" << std::endl;
    return true;
}

bool AudioChannel::sendAudio(std::vector<uint8_t> payload, uint32_t timestamp_ms) {
    if (state_.load() == ChannelState::RECORDING) {
        std::lock_guard<std::mutex> gate(send_gate_);
        if (state_.load() == ChannelState::RECORDING) {
            audio::AudioFrame frame;
            frame.session_id = session_id_;
            frame.sequence = static_cast<uint32_t>(sent_seq_.load() + 1);
            frame.timestamp = timestamp_ms;
            frame.payload = std::move(payload);

            if (transport_.sendAudioFrame(frame)) {
                ++sent_seq_;
                return true;
            }
        }
    }

    uint64_t dropped = ++dropped_outbound_;
    if (shouldLogDrop(dropped)) {
        std::cerr << "[AudioChannel] Dropped outbound frame in " << channelStateName(state_.load())
                  << " (" << dropped << " total)" << std::endl;
    }
    return false;
}

bool AudioChannel::acceptInbound(const audio::AudioFrame& frame) {
    ChannelState current = state_.load();
    bool permitted = current == ChannelState::PROCESSING || current == ChannelState::PLAYING;
    // session_id_ is only written while OPENING, before either permitted state
    bool sameSession = !permitted || frame.session_id.empty() || frame.session_id == session_id_;

    if (permitted && sameSession) {
        ++recv_seq_;
        return true;
    }

    uint64_t dropped = ++dropped_inbound_;
    if (shouldLogDrop(dropped)) {
        std::cerr << "[AudioChannel] Dropped inbound frame in " << channelStateName(current)
                  << (sameSession ? "" : " (foreign session)") << " (" << dropped << " total)" << std::endl;
    }
    return false;
}

} // namespace xvc::session
