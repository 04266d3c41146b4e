#pragma once

#include "audio/audio.hpp"

#include <variant>

namespace Loudness {

static constexpr double MIN_DURATION = 0.4; // seconds, one gating block
static constexpr double EXTREME_GAIN = 20.0; // dB, reported but still applied

enum class Skip {
    TooShort,
    Unmeasurable,
};

struct Normalized {
    double Original; // LUFS
    double Target;   // LUFS
    double Gain;     // dB
};

using Result = std::variant<Normalized, Skip>;

// Integrated loudness (BS.1770-4) in LUFS, -inf when nothing survives gating.
double Measure(const Audio::PcmBuffer &pcm);

double ComputeGain(double target, double measured);

void ApplyGain(Audio::PcmBuffer &pcm, double gainDb);

Result Normalize(Audio::PcmBuffer &pcm, double target);

const char *ToString(Skip skip);

} // namespace Loudness
