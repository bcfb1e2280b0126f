/**
 * AudioFrame.hpp - One compressed audio frame on the wire
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace xvc::audio {

/**
 * A single Opus frame tagged with the channel that owns it.
 * Outbound frames carry the sessionId assigned by the peer; inbound frames
 * are tagged by the transport with the session they arrived on.
 */
struct AudioFrame {
    std::string session_id;
    uint32_t sequence = 0;
    uint32_t timestamp = 0;  // Milliseconds, relative to channel start
    std::vector<uint8_t> payload;
};

} // namespace xvc::audio
