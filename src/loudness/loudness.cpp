#include "loudness.hpp"

#include <algorithm>
#include <cmath>
#include <ebur128.h>
#include <fmt/format.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Loudness {

namespace {

struct StateDeleter {
    void operator()(ebur128_state *st) const { ebur128_destroy(&st); }
};
using StatePtr = std::unique_ptr<ebur128_state, StateDeleter>;

void Check(const int err, const char *what) {
    if (err != EBUR128_SUCCESS) {
        throw std::runtime_error(fmt::format("{} (ebur128 error {})", what, err));
    }
}

// 5 channels: L R C Ls Rs. 6 channels: L R C LFE Ls Rs. Anything else counts every channel at 1.0.
void MapChannels(ebur128_state *st, const int channels) {
    for (int c = 0; c < channels; ++c) {
        int role = EBUR128_LEFT;
        if (channels == 5 && c >= 3) {
            role = c == 3 ? EBUR128_LEFT_SURROUND : EBUR128_RIGHT_SURROUND;
        } else if (channels == 6 && c >= 3) {
            role = c == 3 ? EBUR128_UNUSED : c == 4 ? EBUR128_LEFT_SURROUND : EBUR128_RIGHT_SURROUND;
        }
        Check(ebur128_set_channel(st, static_cast<unsigned int>(c), role), "Failed to map channel");
    }
}

bool AllFinite(const Audio::PcmBuffer &pcm) {
    return std::all_of(pcm.Channels.begin(), pcm.Channels.end(), [](const auto &channel) {
        return std::all_of(channel.begin(), channel.end(), [](const float s) { return std::isfinite(s); });
    });
}

} // namespace

double Measure(const Audio::PcmBuffer &pcm) {
    constexpr double negInf = -std::numeric_limits<double>::infinity();

    const int channels = pcm.ChannelCount();
    const size_t frames = pcm.Frames();
    if (pcm.SampleRate <= 0 || channels == 0 || frames == 0 || !AllFinite(pcm)) {
        return negInf;
    }

    const auto rate = static_cast<unsigned long>(pcm.SampleRate);
    const StatePtr st(ebur128_init(static_cast<unsigned int>(channels), rate, EBUR128_MODE_I));
    if (!st) {
        throw std::runtime_error(fmt::format("Failed to create loudness meter for {} channel(s) at {} Hz", channels,
                                             pcm.SampleRate));
    }
    MapChannels(st.get(), channels);

    // libebur128 takes interleaved frames; feed them a chunk at a time.
    constexpr size_t chunk = 4096;
    std::vector<float> interleaved(chunk * static_cast<size_t>(channels));
    for (size_t offset = 0; offset < frames; offset += chunk) {
        const size_t n = std::min(chunk, frames - offset);
        for (size_t i = 0; i < n; ++i) {
            for (int c = 0; c < channels; ++c) {
                interleaved[i * static_cast<size_t>(channels) + static_cast<size_t>(c)] = pcm.Channels[c][offset + i];
            }
        }
        Check(ebur128_add_frames_float(st.get(), interleaved.data(), n), "Failed to add frames to loudness meter");
    }

    double lufs = negInf;
    Check(ebur128_loudness_global(st.get(), &lufs), "Failed to compute integrated loudness");
    // -HUGE_VAL when no block passes the gates
    return std::isfinite(lufs) ? lufs : negInf;
}

double ComputeGain(const double target, const double measured) {
    return target - measured;
}

void ApplyGain(Audio::PcmBuffer &pcm, const double gainDb) {
    const double scale = std::pow(10.0, gainDb / 20.0);
    for (auto &channel : pcm.Channels) {
        for (auto &sample : channel) {
            sample = static_cast<float>(sample * scale);
        }
    }
}

Result Normalize(Audio::PcmBuffer &pcm, const double target) {
    if (pcm.Duration() < MIN_DURATION) {
        return Skip::TooShort;
    }

    const double measured = Measure(pcm);
    if (std::isinf(measured) || std::isnan(measured)) {
        return Skip::Unmeasurable;
    }

    const double gain = ComputeGain(target, measured);
    ApplyGain(pcm, gain);
    return Normalized{measured, target, gain};
}

const char *ToString(const Skip skip) {
    switch (skip) {
    case Skip::TooShort:
        return "audio too short for loudness measurement";
    case Skip::Unmeasurable:
        return "cannot measure loudness (silent or invalid audio)";
    }
    return "unknown";
}

} // namespace Loudness
