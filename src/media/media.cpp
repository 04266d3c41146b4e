#include "media.hpp"
#include "denoise/denoise.hpp"
#include "loudness/loudness.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

namespace Media {

namespace {

fs::path BridgePath(const fs::path &asset, const char *tag) {
    auto path = asset;
    path.replace_filename(fmt::format(".{}.{}.wav", asset.filename().string(), tag));
    return path;
}

NormalizationOutcome NormalizeNative(AudioAsset &asset, const Options &options, spdlog::logger &log) {
    auto decoded = Audio::Decode(asset.Path);
    if (const auto skip = ProcessPcm(asset, decoded.Pcm, options, log)) {
        return Skipped{*skip};
    }

    const narratune::TempFile partial(narratune::PartialPath(asset.Path));
    Audio::Encode(decoded.Pcm, partial.Path(), Audio::SameAs(decoded.Info));
    narratune::CommitOutput(partial.Path(), asset.Path);

    return Success{*asset.Loudness, options.TargetLoudness, *asset.Gain, asset.Duration};
}

NormalizationOutcome NormalizeBridged(AudioAsset &asset, const Options &options, spdlog::logger &log) {
    const narratune::TempFile in(BridgePath(asset.Path, "in"));
    log.debug("Converting {} to WAV for processing", asset.Name);
    Transcode::ToPcm(asset.Path, in.Path());

    auto decoded = Audio::Decode(in.Path());
    if (const auto skip = ProcessPcm(asset, decoded.Pcm, options, log)) {
        return Skipped{*skip};
    }

    const narratune::TempFile out(BridgePath(asset.Path, "out"));
    Audio::Encode(decoded.Pcm, out.Path(), Audio::FMT_PCM_S16LE);

    const auto ext = GetTraits(asset.Family).Extension;
    log.debug("Converting normalized audio back to {}", ext + 1);
    const narratune::TempFile partial(narratune::PartialPath(asset.Path));
    Transcode::FromPcm(out.Path(), partial.Path(), BridgeEncoder(asset.Family));
    narratune::CommitOutput(partial.Path(), asset.Path);

    return Success{*asset.Loudness, options.TargetLoudness, *asset.Gain, asset.Duration};
}

} // namespace

std::optional<CodecFamily> FromExtension(const fs::path &path) {
    const auto ext = narratune::ToLower(path.extension().string());
    for (const auto family : ALL_FAMILIES) {
        if (ext == GetTraits(family).Extension) {
            return family;
        }
    }
    return std::nullopt;
}

Transcode::EncoderSpec BridgeEncoder(const CodecFamily family) {
    const auto traits = GetTraits(family);
    Transcode::EncoderSpec spec;
    if (traits.Encoder != nullptr) {
        spec.Codec = traits.Encoder;
        if (traits.Bitrate != nullptr) {
            spec.Bitrate = traits.Bitrate;
        }
    }
    return spec;
}

const char *ToString(const SkipReason reason) {
    switch (reason) {
    case SkipReason::TooShort:
        return Loudness::ToString(Loudness::Skip::TooShort);
    case SkipReason::Unmeasurable:
        return Loudness::ToString(Loudness::Skip::Unmeasurable);
    case SkipReason::Unsupported:
        return "unsupported audio format";
    }
    return "unknown";
}

std::string Describe(const NormalizationOutcome &outcome) {
    if (const auto *ok = std::get_if<Success>(&outcome)) {
        return fmt::format("{} -> {} ({})", narratune::FormatLufs(ok->OriginalLoudness),
                           narratune::FormatLufs(ok->TargetLoudness), narratune::FormatDb(ok->Gain));
    }
    if (const auto *skip = std::get_if<Skipped>(&outcome)) {
        return fmt::format("skipped: {}", ToString(skip->Reason));
    }
    return fmt::format("failed: {}", std::get<Failed>(outcome).Reason);
}

std::optional<SkipReason> ProcessPcm(AudioAsset &asset, Audio::PcmBuffer &pcm, const Options &options,
                                     spdlog::logger &log) {
    asset.SampleRate = pcm.SampleRate;
    asset.Channels = pcm.ChannelCount();
    asset.Duration = pcm.Duration();
    log.debug("Loaded {}: {} Hz, {:.2f}s, {} channel(s)", asset.Name, asset.SampleRate, asset.Duration,
              asset.Channels);

    if (asset.Duration < Loudness::MIN_DURATION) {
        log.warn("Audio too short ({:.2f}s) for LUFS measurement, skipping {}", asset.Duration, asset.Name);
        return SkipReason::TooShort;
    }

    Audio::PcmBuffer denoised;
    const Audio::PcmBuffer *source = &pcm;
    if (options.Denoise) {
        log.debug("Applying denoising (strength: {:.2f})", options.DenoiseStrength);
        auto result = Denoise::Reduce(pcm, options.DenoiseStrength);
        if (auto *clean = std::get_if<Audio::PcmBuffer>(&result)) {
            denoised = std::move(*clean);
            source = &denoised;
            log.debug("Denoising complete");
        } else {
            log.warn("Denoising failed for {}: {}, continuing without denoising", asset.Name,
                     std::get<Denoise::Failure>(result).Reason);
        }
    }

    Audio::PcmBuffer work = *source;
    const auto result = Loudness::Normalize(work, options.TargetLoudness);
    if (const auto *skip = std::get_if<Loudness::Skip>(&result)) {
        if (*skip == Loudness::Skip::TooShort) {
            return SkipReason::TooShort;
        }
        log.warn("Cannot measure loudness (silent or invalid audio) for {}, skipping", asset.Name);
        return SkipReason::Unmeasurable;
    }

    const auto &normalized = std::get<Loudness::Normalized>(result);
    asset.Loudness = normalized.Original;
    asset.Gain = normalized.Gain;
    log.debug("Measured loudness: {}", narratune::FormatLufs(normalized.Original));
    if (std::abs(normalized.Gain) > Loudness::EXTREME_GAIN) {
        log.info("Applying extreme gain {} to {}", narratune::FormatDb(normalized.Gain), asset.Name);
    }

    pcm = std::move(work);
    return std::nullopt;
}

NormalizationOutcome NormalizeFile(const fs::path &path, const Options &options, spdlog::logger &log) {
    AudioAsset asset;
    asset.Path = path;
    asset.Name = path.filename().string();
    log.info("Processing: {}", asset.Name);

    const auto family = FromExtension(path);
    if (!family) {
        log.warn("Unsupported audio format '{}' for {}, skipping", path.extension().string(), asset.Name);
        return Skipped{SkipReason::Unsupported};
    }
    asset.Family = *family;

    try {
        NormalizationOutcome outcome;
        switch (GetTraits(asset.Family).Mode) {
        case Capability::Native:
            outcome = NormalizeNative(asset, options, log);
            break;
        case Capability::Bridged:
            outcome = NormalizeBridged(asset, options, log);
            break;
        }
        if (std::holds_alternative<Success>(outcome)) {
            log.info("Normalized {}: {}", asset.Name, Describe(outcome));
        }
        return outcome;
    } catch (const std::exception &e) {
        log.error("Failed to normalize {}: {}", asset.Name, e.what());
        return Failed{e.what()};
    }
}

std::vector<AssetReport> NormalizeFiles(const std::vector<fs::path> &paths, const Options &options,
                                        spdlog::logger &log, const narratune::CancellationToken *token) {
    std::vector<AssetReport> reports;
    reports.reserve(paths.size());
    for (const auto &path : paths) {
        if (token) {
            token->ThrowIfCancelled();
        }
        reports.push_back({path.filename().string(), NormalizeFile(path, options, log)});
    }
    return reports;
}

} // namespace Media
