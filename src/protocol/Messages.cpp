/**
 * Messages.cpp - Control message construction and validation
 */

#include "xvc/protocol/Messages.hpp"

#include <iostream>

using json = nlohmann::json;

namespace xvc::protocol {

namespace {

struct TypeEntry {
    MessageType type;
    const char* name;
};

constexpr TypeEntry kTypes[] = {
    {MessageType::Hello, "hello"},
    {MessageType::HelloAck, "hello_ack"},
    {MessageType::StartAudio, "start_audio"},
    {MessageType::AudioChannelOpened, "audio_channel_opened"},
    {MessageType::StopAudio, "stop_audio"},
    {MessageType::AudioChannelClosed, "audio_channel_closed"},
    {MessageType::Listen, "listen"},
    {MessageType::Abort, "abort"},
    {MessageType::Tts, "tts"},
    {MessageType::Stt, "stt"},
    {MessageType::Llm, "llm"},
    {MessageType::Iot, "iot"},
};

json withSession(const char* type, const std::string& session_id) {
    json message = {{"type", type}};
    if (!session_id.empty()) {
        message["session_id"] = session_id;
    }
    return message;
}

} // namespace

const char* typeName(MessageType type) {
    for (const auto& entry : kTypes) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

MessageType typeOf(const json& message) {
    if (!message.is_object()) return MessageType::Unknown;
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) return MessageType::Unknown;

    const std::string& name = it->get_ref<const std::string&>();
    for (const auto& entry : kTypes) {
        if (name == entry.name) return entry.type;
    }
    return MessageType::Unknown;
}

std::optional<json> parse(const std::string& text) {
    try {
        json message = json::parse(text);
        if (!message.is_object() || !message.contains("type") || !message["type"].is_string()) {
            std::cerr << "[Protocol] Dropping message without type" << std::endl;
            return std::nullopt;
        }
        return message;
    } catch (const json::parse_error& e) {
        std::cerr << "[Protocol] Malformed control message: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<HelloAck> parseHelloAck(const json& message) {
    MessageType type = typeOf(message);
    if (type != MessageType::HelloAck && type != MessageType::Hello) {
        return std::nullopt;
    }

    HelloAck ack;
    ack.session_id = sessionIdOf(message);
    if (ack.session_id.empty()) {
        std::cerr << "[Protocol] hello_ack without session_id" << std::endl;
        return std::nullopt;
    }
    ack.transport = stringField(message, "transport");

    try {
        if (message.contains("audio_params") && message["audio_params"].is_object()) {
            const json& p = message["audio_params"];
            AudioParams params;
            params.format = p.value("format", params.format);
            params.sample_rate = p.value("sample_rate", params.sample_rate);
            params.channels = p.value("channels", params.channels);
            params.frame_duration = p.value("frame_duration", params.frame_duration);
            ack.audio_params = params;
        }

        if (message.contains("udp") && message["udp"].is_object()) {
            const json& u = message["udp"];
            UdpParams udp;
            udp.server = stringField(u, "server");
            udp.port = u.value("port", static_cast<uint16_t>(0));
            udp.key = stringField(u, "key");
            udp.nonce = stringField(u, "nonce");
            if (udp.server.empty() || udp.port == 0) {
                std::cerr << "[Protocol] Ignoring incomplete udp block" << std::endl;
            } else {
                ack.udp = udp;
            }
        }
    } catch (const json::type_error& e) {
        std::cerr << "[Protocol] Bad hello_ack field: " << e.what() << std::endl;
        return std::nullopt;
    }

    return ack;
}

std::string sessionIdOf(const json& message) {
    return stringField(message, "session_id");
}

std::string stringField(const json& object, const char* key) {
    if (!object.is_object()) return "";
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

json makeHello(const Identity& identity, const std::string& transport, const AudioParams& params) {
    json message = {
        {"type", "hello"},
        {"version", 1},
        {"transport", transport},
        {"audio_params", {
            {"format", params.format},
            {"sample_rate", params.sample_rate},
            {"channels", params.channels},
            {"frame_duration", params.frame_duration},
        }},
    };
    if (!identity.device_id.empty()) message["device_id"] = identity.device_id;
    if (!identity.client_id.empty()) message["client_id"] = identity.client_id;
    return message;
}

json makeStartAudio(const std::string& session_id) {
    return withSession("start_audio", session_id);
}

json makeStopAudio(const std::string& session_id) {
    return withSession("stop_audio", session_id);
}

json makeListenStart(const std::string& session_id, const std::string& mode) {
    json message = withSession("listen", session_id);
    message["state"] = "start";
    message["mode"] = mode;
    return message;
}

json makeListenStop(const std::string& session_id) {
    json message = withSession("listen", session_id);
    message["state"] = "stop";
    return message;
}

json makeListenDetect(const std::string& session_id, const std::string& text) {
    json message = withSession("listen", session_id);
    message["state"] = "detect";
    message["text"] = text;
    return message;
}

json makeAbort(const std::string& session_id, const std::string& reason) {
    json message = withSession("abort", session_id);
    if (!reason.empty()) {
        message["reason"] = reason;
    }
    return message;
}

json makeIotDescriptors(const std::string& session_id, const json& descriptors) {
    json message = withSession("iot", session_id);
    message["descriptors"] = descriptors;
    return message;
}

json makeIotStates(const std::string& session_id, const json& states) {
    json message = withSession("iot", session_id);
    message["states"] = states;
    return message;
}

json makeIotResults(const std::string& session_id, const json& results) {
    json message = withSession("iot", session_id);
    message["results"] = results;
    return message;
}

} // namespace xvc::protocol
