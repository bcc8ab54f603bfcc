/**
 * Stream presets and state names.
 */

#include "stream/stream_types.h"

#include <algorithm>

namespace kizuna {

namespace {

struct VideoPreset {
    int width;
    int height;
    int fps;
    int bitrate_kbps;
};

constexpr VideoPreset kVideoPresets[] = {
    {854, 480, 15, 500},
    {1280, 720, 30, 1500},
    {1920, 1080, 30, 3000},
    {1920, 1080, 60, 6000},
};

struct AudioPreset {
    int sample_rate_hz;
    int bitrate_kbps;
};

constexpr AudioPreset kAudioPresets[] = {
    {16000, 32},
    {24000, 64},
    {32000, 128},
    {48000, 256},
};

// 20 ms packets.
constexpr int kAudioPacketsPerSecond = 50;

} // namespace

const char* to_string(StreamKind kind) {
    switch (kind) {
    case StreamKind::camera: return "camera";
    case StreamKind::screen: return "screen";
    case StreamKind::audio:  return "audio";
    }
    return "unknown";
}

std::optional<StreamKind> stream_kind_from_string(const std::string& name) {
    if (name == "camera")
        return StreamKind::camera;
    if (name == "screen")
        return StreamKind::screen;
    if (name == "audio")
        return StreamKind::audio;
    return std::nullopt;
}

const char* to_string(StreamState state) {
    switch (state) {
    case StreamState::starting: return "starting";
    case StreamState::active:   return "active";
    case StreamState::stopping: return "stopping";
    case StreamState::stopped:  return "stopped";
    }
    return "unknown";
}

EncodeParams encode_params(StreamKind kind, int quality) {
    quality = std::clamp(quality, 0, 100);
    const int band = std::min(quality / 25, 3);
    const int scale = 50 + 2 * (quality - band * 25);   // percent of the preset bitrate

    EncodeParams params;
    if (kind == StreamKind::audio) {
        const auto& preset = kAudioPresets[band];
        params.sample_rate_hz = preset.sample_rate_hz;
        params.fps = kAudioPacketsPerSecond;
        params.bitrate_kbps = std::max(1, preset.bitrate_kbps * scale / 100);
        return params;
    }

    const auto& preset = kVideoPresets[band];
    params.width = preset.width;
    params.height = preset.height;
    params.fps = preset.fps;
    params.bitrate_kbps = std::max(1, preset.bitrate_kbps * scale / 100);
    return params;
}

Frame SyntheticFrameSource::next_frame(const EncodeParams& params) {
    const int fps = std::max(params.fps, 1);
    const auto size = static_cast<std::size_t>(std::max(1, params.bitrate_kbps * 1000 / 8 / fps));

    Frame frame;
    frame.seq = seq_++;
    frame.timestamp_us =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - origin_).count();
    frame.keyframe = frame.seq % static_cast<uint64_t>(fps) == 0;
    frame.data.resize(size);
    for (std::size_t i = 0; i < size; ++i)
        frame.data[i] = static_cast<uint8_t>((frame.seq + i) & 0xff);
    return frame;
}

} // namespace kizuna
