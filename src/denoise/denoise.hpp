#pragma once

#include "audio/audio.hpp"

#include <string>
#include <variant>

namespace Denoise {

static constexpr int FFT_SIZE = 1024;
static constexpr int HOP_SIZE = FFT_SIZE / 4;
static constexpr double THRESHOLD_STD = 1.5;
static constexpr double FREQ_SMOOTH_HZ = 500.0;
static constexpr double TIME_SMOOTH_MS = 50.0;
static constexpr double TOP_DB = 80.0; // bins are floored this far below the loudest one

struct Failure {
    std::string Reason;
};

using Result = std::variant<Audio::PcmBuffer, Failure>;

// Stationary spectral gating with the noise profile estimated from the signal itself.
// The output always has the sample rate, channel count and length of the input.
Result Reduce(const Audio::PcmBuffer &pcm, double strength);

} // namespace Denoise
