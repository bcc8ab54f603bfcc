#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "common/types.h"

namespace kizuna {

using StreamId = std::string;

enum class StreamKind {
    camera,
    screen,
    audio,
};

const char* to_string(StreamKind kind);
std::optional<StreamKind> stream_kind_from_string(const std::string& name);

enum class StreamState {
    starting,
    active,
    stopping,
    stopped,
};

const char* to_string(StreamState state);

/// Encoder settings derived from a 0-100 quality value.
struct EncodeParams {
    int width = 0;              // 0 for audio
    int height = 0;
    int fps = 0;                // frames (or audio packets) per second
    int bitrate_kbps = 0;
    int sample_rate_hz = 0;     // audio only
};

/**
 * Map quality to encoder settings. Video uses four presets (480p/15,
 * 720p/30, 1080p/30, 1080p/60); audio picks 16/24/32/48 kHz. Bitrate scales
 * linearly from half to full preset bitrate within each quarter.
 */
EncodeParams encode_params(StreamKind kind, int quality);

[[nodiscard]] inline bool valid_quality(int quality) { return quality >= 0 && quality <= 100; }

struct StreamStatus {
    StreamId id;
    PeerId peer_id;
    std::string session_id;
    StreamKind kind = StreamKind::camera;
    bool outgoing = true;
    StreamState state = StreamState::starting;
    int requested_quality = 0;
    int quality = 0;                  // current, after any degradation
    EncodeParams params;
    uint64_t frames_sent = 0;         // received, for incoming streams
    uint64_t frames_dropped = 0;
    uint64_t bytes = 0;
    unsigned degradations = 0;
    std::size_t queue_depth = 0;
    std::size_t peak_queue_depth = 0;
    std::error_code error;            // why the stream stopped, if not on request
};

struct Frame {
    uint64_t seq = 0;
    int64_t timestamp_us = 0;
    bool keyframe = false;
    Bytes data;
};

/**
 * Produces encoded media frames for one outgoing stream.
 *
 * Capture and encoding are platform specific; the engine only asks for the
 * next frame at the current settings.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual Frame next_frame(const EncodeParams& params) = 0;
};

/// Frames of the right size and cadence with a deterministic payload.
class SyntheticFrameSource : public FrameSource {
public:
    Frame next_frame(const EncodeParams& params) override;

private:
    uint64_t seq_ = 0;
    Clock::time_point origin_ = Clock::now();
};

} // namespace kizuna
