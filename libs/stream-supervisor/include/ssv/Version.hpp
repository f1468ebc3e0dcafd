#pragma once
#include <cstdint>

namespace ssv {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;

// HLS output shape
constexpr int SEGMENT_DURATION_SEC = 2;
constexpr int PLAYLIST_WINDOW_SEGMENTS = 6;
constexpr int AUDIO_SAMPLE_RATE_HZ = 44100;

// Process control
constexpr int STOP_GRACE_MS = 5000;
constexpr int LAUNCH_FAILURE_EXIT_CODE = -1;
constexpr int DEVICE_QUERY_TIMEOUT_MS = 10000;
constexpr int SERVICE_STOP_TIMEOUT_MS = 2000;

constexpr int LOG_TAIL_LINES = 200;

} // namespace ssv
