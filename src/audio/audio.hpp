#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
}

#include "lib.hpp"
#include <spdlog/common.h>

#include <cstddef>
#include <vector>

namespace Audio {

void Initialize(spdlog::level::level_enum level);

// Planar float samples, one vector per channel, all of the same length.
struct PcmBuffer {
    int SampleRate = 0;
    std::vector<std::vector<float>> Channels;

    [[nodiscard]] int ChannelCount() const { return static_cast<int>(Channels.size()); }

    [[nodiscard]] size_t Frames() const { return Channels.empty() ? 0 : Channels.front().size(); }

    [[nodiscard]] double Duration() const {
        return SampleRate > 0 ? static_cast<double>(Frames()) / SampleRate : 0.0;
    }
};

struct StreamInfo {
    AVCodecID CodecId = AV_CODEC_ID_NONE;
    AVSampleFormat SampleFormat = AV_SAMPLE_FMT_NONE;
    int SampleRate = 0;
    int Channels = 0;
    int BitsPerRawSample = 0;
    int64_t BitRate = 0;
};

struct EncodeFormat {
    AVCodecID CodecId;
    AVSampleFormat SampleFormat;
    int64_t BitRate;
    int BitsPerRawSample;
    const char *EncoderName; // preferred encoder, nullptr for the default one
};

// Intermediate representation handed to and from the external transcoder.
static constexpr EncodeFormat FMT_PCM_S16LE = {AV_CODEC_ID_PCM_S16LE, AV_SAMPLE_FMT_S16, 0, 16, nullptr};
static constexpr int BRIDGE_SAMPLE_RATE = 48000;
static constexpr int BRIDGE_CHANNELS = 2;

struct DecodedAudio {
    StreamInfo Info;
    PcmBuffer Pcm;
};

DecodedAudio Decode(const fs::path &path);

// Format that writes audio back with the codec and sample layout it was read with.
EncodeFormat SameAs(const StreamInfo &info);

void Encode(const PcmBuffer &pcm, const fs::path &dstPath, const EncodeFormat &target);

} // namespace Audio
