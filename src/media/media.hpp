#pragma once

#include "audio/audio.hpp"
#include "lib.hpp"
#include "transcode/transcode.hpp"

#include <array>
#include <optional>
#include <spdlog/logger.h>
#include <string>
#include <variant>
#include <vector>

namespace Media {

enum class CodecFamily {
    Wav,
    Flac,
    Ogg,
    Mp3,
    M4a,
    Wma,
    Aac,
};

enum class Capability {
    Native,  // decoded and encoded in-process
    Bridged, // round trip through the external transcoder
};

struct Traits {
    const char *Extension;
    Capability Mode;
    const char *Encoder; // bridged encode, nullptr means passthrough
    const char *Bitrate;
};

inline constexpr std::array ALL_FAMILIES = {CodecFamily::Wav, CodecFamily::Flac, CodecFamily::Ogg, CodecFamily::Mp3,
                                            CodecFamily::M4a, CodecFamily::Wma,  CodecFamily::Aac};

constexpr Traits GetTraits(const CodecFamily family) {
    switch (family) {
    case CodecFamily::Wav:
        return {".wav", Capability::Native, nullptr, nullptr};
    case CodecFamily::Flac:
        return {".flac", Capability::Native, nullptr, nullptr};
    case CodecFamily::Ogg:
        return {".ogg", Capability::Native, nullptr, nullptr};
    case CodecFamily::Mp3:
        return {".mp3", Capability::Bridged, "libmp3lame", "192k"};
    case CodecFamily::M4a:
        return {".m4a", Capability::Bridged, "aac", "192k"};
    case CodecFamily::Wma:
        return {".wma", Capability::Bridged, "wmav2", "192k"};
    case CodecFamily::Aac:
        return {".aac", Capability::Bridged, "aac", "192k"};
    }
    return {"", Capability::Bridged, nullptr, nullptr};
}

std::optional<CodecFamily> FromExtension(const fs::path &path);

inline bool IsAudioFile(const fs::path &path) {
    return FromExtension(path).has_value();
}

Transcode::EncoderSpec BridgeEncoder(CodecFamily family);

struct Options {
    double TargetLoudness = -16.0; // LUFS
    bool Denoise = false;
    double DenoiseStrength = 0.5;
};

enum class SkipReason {
    TooShort,
    Unmeasurable,
    Unsupported,
};

struct Success {
    double OriginalLoudness;
    double TargetLoudness;
    double Gain;
    double Duration;
};

struct Skipped {
    SkipReason Reason;
};

struct Failed {
    std::string Reason;
};

using NormalizationOutcome = std::variant<Success, Skipped, Failed>;

struct AudioAsset {
    fs::path Path;
    std::string Name;
    CodecFamily Family = CodecFamily::Wav;
    int SampleRate = 0;
    int Channels = 0;
    double Duration = 0.0;
    std::optional<double> Loudness;
    std::optional<double> Gain; // only set once Loudness holds a valid measurement
};

struct AssetReport {
    std::string Name;
    NormalizationOutcome Outcome;
};

const char *ToString(SkipReason reason);

// "-23.0 LUFS -> -16.0 LUFS (+7.0 dB)" for successes, the reason otherwise.
std::string Describe(const NormalizationOutcome &outcome);

std::optional<SkipReason> ProcessPcm(AudioAsset &asset, Audio::PcmBuffer &pcm, const Options &options,
                                     spdlog::logger &log);

// Skipped and failed files are left untouched.
NormalizationOutcome NormalizeFile(const fs::path &path, const Options &options, spdlog::logger &log);

std::vector<AssetReport> NormalizeFiles(const std::vector<fs::path> &paths, const Options &options,
                                        spdlog::logger &log, const narratune::CancellationToken *token = nullptr);

} // namespace Media
