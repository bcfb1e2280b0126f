/**
 * FrameQueue.cpp - Bounded drop-oldest queue
 * Note: Most logic is in header (template class)
 */

#include "xvc/audio/FrameQueue.hpp"
#include "xvc/audio/AudioFrame.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace xvc::audio {

// Explicit instantiation for the frame types used by the pipeline
template class FrameQueue<AudioFrame>;
template class FrameQueue<std::vector<int16_t>>;
template class FrameQueue<std::pair<uint64_t, AudioFrame>>;

} // namespace xvc::audio
