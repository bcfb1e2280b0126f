/**
 * AudioChannel.hpp - Lifecycle of one streamed-audio exchange
 *
 * CLOSED -> OPENING -> OPENED -> RECORDING -> PROCESSING -> PLAYING -> CLOSING -> CLOSED
 *
 * Transitions are driven from the session's event path. Frame traffic runs on
 * the capture and network threads and is gated by an atomic read of the state:
 * outbound audio only while RECORDING, inbound TTS only while PROCESSING or
 * PLAYING. Everything else is dropped and counted.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "xvc/audio/AudioFrame.hpp"
#include "xvc/protocol/Messages.hpp"
#include "xvc/transport/Transport.hpp"

namespace xvc::session {

enum class ChannelState {
    CLOSED,
    OPENING,
    OPENED,
    RECORDING,
    PROCESSING,
    PLAYING,
    CLOSING
};

const char* channelStateName(ChannelState state);

class AudioChannel {
public:
    explicit AudioChannel(transport::Transport& transport);
    ~AudioChannel();

    AudioChannel(const AudioChannel&) = delete;
    AudioChannel& operator=(const AudioChannel&) = delete;

    ChannelState state() const { return state_.load(); }
    const std::string& sessionId() const { return session_id_; }

    // Event-path transitions. Each returns false (and logs) when the
    // current state does not allow it.

    /** CLOSED -> OPENING, sends hello */
    bool open(const protocol::Identity& identity, const protocol::AudioParams& params);

    /** Stores the peer-assigned sessionId and sends start_audio (stays OPENING) */
    bool onHelloAck(const std::string& session_id);

    /** OPENING -> OPENED, on audio_channel_opened */
    bool onOpened();

    /** OPENED | PROCESSING | PLAYING -> RECORDING */
    bool startRecording();

    /** RECORDING -> PROCESSING */
    bool endOfSpeech();

    /** PROCESSING -> PLAYING, first TTS audio of the turn */
    bool startPlaying();

    /** Any open state -> CLOSING, sends stop_audio. Frame acceptance stops here. */
    bool close();

    /** CLOSING -> CLOSED */
    bool onClosed();

    // Frame traffic

    /**
     * Forward one encoded frame to the transport. Called from the capture
     * thread. Dropped unless RECORDING.
     */
    bool sendAudio(std::vector<uint8_t> payload, uint32_t timestamp_ms);

    /**
     * Admit one received frame for rendering. Called from the network
     * thread. Dropped unless PROCESSING or PLAYING, or when the frame is
     * tagged with a different session.
     */
    bool acceptInbound(const audio::AudioFrame& frame);

    uint64_t sentSeq() const { return sent_seq_.load(); }
    uint64_t recvSeq() const { return recv_seq_.load(); }
    uint64_t droppedOutbound() const { return dropped_outbound_.load(); }
    uint64_t droppedInbound() const { return dropped_inbound_.load(); }

private:
    bool transition(ChannelState from, ChannelState to);
    void setState(ChannelState to);

    transport::Transport& transport_;
    std::atomic<ChannelState> state_{ChannelState::CLOSED};
    std::string session_id_;

    // Held while a frame is handed to the transport and while leaving
    // RECORDING, so no frame is queued behind stop_audio.
    std::mutex send_gate_;

    std::atomic<uint64_t> sent_seq_{0};
    std::atomic<uint64_t> recv_seq_{0};
    std::atomic<uint64_t> dropped_outbound_{0};
    std::atomic<uint64_t> dropped_inbound_{0};
};

} // namespace xvc::session
