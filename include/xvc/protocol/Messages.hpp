/**
 * Messages.hpp - Session-level control message builders and parsers
 *
 * Every control message is a JSON object with a "type" discriminator.
 * Builders return ready-to-send objects; parsers validate untrusted input
 * and return nullopt (logged) on protocol violations.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace xvc::protocol {

enum class MessageType {
    Hello,
    HelloAck,
    StartAudio,
    AudioChannelOpened,
    StopAudio,
    AudioChannelClosed,
    Listen,
    Abort,
    Tts,
    Stt,
    Llm,
    Iot,
    Unknown
};

struct AudioParams {
    std::string format = "opus";
    int sample_rate = 16000;
    int channels = 1;
    int frame_duration = 60;
};

struct Identity {
    std::string device_id;
    std::string client_id;
};

/** UDP audio endpoint announced by an MQTT peer in hello_ack. */
struct UdpParams {
    std::string server;
    uint16_t port = 0;
    std::string key;    // hex, 16 bytes
    std::string nonce;  // hex, 16 bytes
};

struct HelloAck {
    std::string session_id;
    std::string transport;
    std::optional<AudioParams> audio_params;
    std::optional<UdpParams> udp;
};

const char* typeName(MessageType type);
MessageType typeOf(const nlohmann::json& message);

/**
 * Parse a text frame into a control message.
 * @return nullopt if the text is not a JSON object with a string "type"
 */
std::optional<nlohmann::json> parse(const std::string& text);

/**
 * Extract the handshake reply. A reply of type "hello" is accepted as
 * hello_ack as long as it carries a session_id.
 */
std::optional<HelloAck> parseHelloAck(const nlohmann::json& message);

/** session_id field of a message, empty if absent. */
std::string sessionIdOf(const nlohmann::json& message);

/** String field of an object; empty when missing or not a string. */
std::string stringField(const nlohmann::json& object, const char* key);

nlohmann::json makeHello(const Identity& identity, const std::string& transport,
                         const AudioParams& params);
nlohmann::json makeStartAudio(const std::string& session_id);
nlohmann::json makeStopAudio(const std::string& session_id);

/** mode: "manual", "auto" or "realtime" */
nlohmann::json makeListenStart(const std::string& session_id, const std::string& mode);
nlohmann::json makeListenStop(const std::string& session_id);
nlohmann::json makeListenDetect(const std::string& session_id, const std::string& text);

/** reason is omitted from the message when empty */
nlohmann::json makeAbort(const std::string& session_id, const std::string& reason = "");

nlohmann::json makeIotDescriptors(const std::string& session_id, const nlohmann::json& descriptors);
nlohmann::json makeIotStates(const std::string& session_id, const nlohmann::json& states);
nlohmann::json makeIotResults(const std::string& session_id, const nlohmann::json& results);

} // namespace xvc::protocol
