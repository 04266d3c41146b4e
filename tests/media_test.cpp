#include "common.hpp"

#include "loudness/loudness.hpp"
#include "media/media.hpp"

#include <algorithm>

using namespace Media;

int main(const int argc, char *argv[]) {
    Setup();
    Audio::Initialize(spdlog::level::warn);
    const int ret = Catch::Session().run(argc, argv);
    return ret;
}

TEST_CASE("FromExtension") {
    REQUIRE(FromExtension("a.wav") == CodecFamily::Wav);
    REQUIRE(FromExtension("b.FLAC") == CodecFamily::Flac);
    REQUIRE(FromExtension("media/c.Mp3") == CodecFamily::Mp3);
    REQUIRE(FromExtension("d.m4a") == CodecFamily::M4a);
    REQUIRE(FromExtension("e.wma") == CodecFamily::Wma);
    REQUIRE(FromExtension("f.aac") == CodecFamily::Aac);
    REQUIRE(FromExtension("g.ogg") == CodecFamily::Ogg);
    REQUIRE_FALSE(FromExtension("image1.png").has_value());
    REQUIRE_FALSE(FromExtension("noext").has_value());
    REQUIRE_FALSE(IsAudioFile("slide1.xml"));
}

TEST_CASE("Traits") {
    for (const auto family : ALL_FAMILIES) {
        const auto traits = GetTraits(family);
        REQUIRE(FromExtension(fs::path("x") += traits.Extension) == family);
        if (traits.Mode == Capability::Native) {
            REQUIRE(traits.Encoder == nullptr);
        }
    }

    SECTION("Bridged encoders") {
        REQUIRE(BridgeEncoder(CodecFamily::Mp3).Codec == "libmp3lame");
        REQUIRE(BridgeEncoder(CodecFamily::Mp3).Bitrate == "192k");
        REQUIRE(BridgeEncoder(CodecFamily::M4a).Codec == "aac");
        REQUIRE(BridgeEncoder(CodecFamily::Wma).Codec == "wmav2");
        REQUIRE(BridgeEncoder(CodecFamily::Aac).Codec == "aac");
    }

    SECTION("Anything else is copied") {
        const auto spec = BridgeEncoder(CodecFamily::Wav);
        REQUIRE(spec.Codec == "copy");
        REQUIRE_FALSE(spec.Bitrate.has_value());
    }
}

TEST_CASE("Describe") {
    REQUIRE(Describe(Success{-23.0, -16.0, 7.0, 3.0}) == "-23.0 LUFS -> -16.0 LUFS (+7.0 dB)");
    REQUIRE(Describe(Success{-10.0, -16.0, -6.0, 3.0}) == "-10.0 LUFS -> -16.0 LUFS (-6.0 dB)");
    REQUIRE(Describe(Skipped{SkipReason::TooShort}).rfind("skipped: ", 0) == 0);
    REQUIRE(Describe(Failed{"decoder exploded"}) == "failed: decoder exploded");
}

TEST_CASE("ProcessPcm") {
    CapturedLog log;
    Options options;

    SECTION("Fills the measurement") {
        AudioAsset asset;
        asset.Name = "voice.wav";
        auto pcm = MakeSine(48000, 1, 2.0, 997.0, 0.1);
        REQUIRE_FALSE(ProcessPcm(asset, pcm, options, *log.Logger).has_value());
        REQUIRE(asset.SampleRate == 48000);
        REQUIRE(asset.Channels == 1);
        REQUIRE(asset.Duration == Catch::Approx(2.0));
        REQUIRE(asset.Loudness.has_value());
        REQUIRE(*asset.Gain == Catch::Approx(options.TargetLoudness - *asset.Loudness).margin(1e-6));
        REQUIRE(Loudness::Measure(pcm) == Catch::Approx(options.TargetLoudness).margin(0.5));
    }

    SECTION("Silence leaves the gain unset") {
        AudioAsset asset;
        auto pcm = MakeSine(48000, 2, 1.0, 997.0, 0.0);
        REQUIRE(ProcessPcm(asset, pcm, options, *log.Logger) == SkipReason::Unmeasurable);
        REQUIRE_FALSE(asset.Loudness.has_value());
        REQUIRE_FALSE(asset.Gain.has_value());
    }

    SECTION("Denoise failure falls back to the original audio") {
        options.Denoise = true;
        options.DenoiseStrength = 2.0;
        AudioAsset asset;
        asset.Name = "noisy.wav";
        auto pcm = MakeSine(48000, 1, 1.0, 997.0, 0.1);
        REQUIRE_FALSE(ProcessPcm(asset, pcm, options, *log.Logger).has_value());
        REQUIRE(log.Text().find("continuing without denoising") != std::string::npos);
    }

    SECTION("Extreme gain is reported and applied") {
        AudioAsset asset;
        asset.Name = "whisper.wav";
        auto pcm = MakeSine(48000, 1, 1.0, 997.0, 0.001);
        REQUIRE_FALSE(ProcessPcm(asset, pcm, options, *log.Logger).has_value());
        REQUIRE(*asset.Gain > Loudness::EXTREME_GAIN);
        REQUIRE(log.Text().find("extreme gain") != std::string::npos);
    }
}

TEST_CASE("NormalizeFile") {
    CapturedLog log;
    const Options options;
    const auto dir = CleanOutputDir("media");

    SECTION("WAV keeps its format and reaches the target") {
        const auto path = dir / "narration.wav";
        Audio::Encode(MakeSine(44100, 2, 3.0, 997.0, 0.1), path, Audio::FMT_PCM_S16LE);

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));
        const auto &ok = std::get<Success>(outcome);
        REQUIRE(ok.Gain == Catch::Approx(ok.TargetLoudness - ok.OriginalLoudness).margin(1e-6));
        REQUIRE(ok.Duration == Catch::Approx(3.0).margin(0.01));

        const auto decoded = Audio::Decode(path);
        REQUIRE(decoded.Info.CodecId == AV_CODEC_ID_PCM_S16LE);
        REQUIRE(decoded.Info.SampleRate == 44100);
        REQUIRE(decoded.Info.Channels == 2);
        REQUIRE(std::abs(Loudness::Measure(decoded.Pcm) - options.TargetLoudness) < 0.5);
        REQUIRE_FALSE(fs::exists(narratune::PartialPath(path)));
    }

    SECTION("-23 LUFS FLAC gains 7 dB") {
        const auto path = dir / "quiet.flac";
        auto pcm = MakeSine(48000, 1, 3.0, 997.0, 0.3);
        Loudness::ApplyGain(pcm, Loudness::ComputeGain(-23.0, Loudness::Measure(pcm)));
        Audio::Encode(pcm, path, Audio::SameAs({AV_CODEC_ID_FLAC, AV_SAMPLE_FMT_S16, 48000, 1, 16, 0}));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));
        REQUIRE(std::get<Success>(outcome).Gain == Catch::Approx(7.0).margin(0.05));

        const auto decoded = Audio::Decode(path);
        REQUIRE(decoded.Info.CodecId == AV_CODEC_ID_FLAC);
        REQUIRE(std::abs(Loudness::Measure(decoded.Pcm) + 16.0) < 0.5);
    }

    SECTION("Ogg Vorbis stays Vorbis") {
        const auto path = dir / "intro.ogg";
        Audio::Encode(MakeSine(48000, 2, 3.0, 997.0, 0.1), path,
                      Audio::SameAs({AV_CODEC_ID_VORBIS, AV_SAMPLE_FMT_FLTP, 48000, 2, 0, 128000}));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));

        const auto decoded = Audio::Decode(path);
        REQUIRE(decoded.Info.CodecId == AV_CODEC_ID_VORBIS);
        REQUIRE(decoded.Info.Channels == 2);
        REQUIRE(std::abs(Loudness::Measure(decoded.Pcm) - options.TargetLoudness) < 0.5);
        REQUIRE_FALSE(fs::exists(narratune::PartialPath(path)));
    }

    SECTION("0.2 s file is skipped and left untouched") {
        const auto path = dir / "blip.wav";
        Audio::Encode(MakeSine(48000, 1, 0.2, 997.0, 0.1), path, Audio::FMT_PCM_S16LE);
        const auto before = ReadBytes(path);

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Skipped>(outcome));
        REQUIRE(std::get<Skipped>(outcome).Reason == SkipReason::TooShort);
        REQUIRE(ReadBytes(path) == before);
    }

    SECTION("Unknown extension is skipped") {
        const auto path = dir / "notes.txt";
        WriteBytes(path, "hello");
        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Skipped>(outcome));
        REQUIRE(std::get<Skipped>(outcome).Reason == SkipReason::Unsupported);
    }

    SECTION("Corrupt audio fails without touching the file") {
        const auto path = dir / "broken.wav";
        WriteBytes(path, "RIFF definitely not audio");
        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Failed>(outcome));
        REQUIRE(ReadBytes(path) == "RIFF definitely not audio");
    }

    SECTION("Every file gets a report") {
        const auto a = dir / "a.wav";
        const auto b = dir / "b.txt";
        Audio::Encode(MakeSine(48000, 1, 1.0, 997.0, 0.1), a, Audio::FMT_PCM_S16LE);
        WriteBytes(b, "x");

        const auto reports = NormalizeFiles({a, b}, options, *log.Logger);
        REQUIRE(reports.size() == 2);
        REQUIRE(reports[0].Name == "a.wav");
        REQUIRE(std::holds_alternative<Success>(reports[0].Outcome));
        REQUIRE(std::holds_alternative<Skipped>(reports[1].Outcome));
    }

    SECTION("Cancellation stops between files") {
        narratune::CancellationToken token;
        token.Cancel();
        REQUIRE_THROWS_AS(NormalizeFiles({dir / "a.wav"}, options, *log.Logger, &token), narratune::Cancelled);
    }
}

namespace {

bool Contains(const std::vector<std::string> &argv, const std::vector<std::string> &seq) {
    return std::search(argv.begin(), argv.end(), seq.begin(), seq.end()) != argv.end();
}

std::vector<std::string> Listing(const fs::path &dir) {
    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Stereo 48 kHz WAV at -23 LUFS, the shape the transcoder hands back.
fs::path BridgeFixture() {
    const auto path = GetOutputPath("bridge_fixture.wav");
    auto pcm = MakeSine(48000, 2, 3.0, 997.0, 0.1);
    Loudness::ApplyGain(pcm, Loudness::ComputeGain(-23.0, Loudness::Measure(pcm)));
    Audio::Encode(pcm, path, Audio::FMT_PCM_S16LE);
    return path;
}

// Decoding answers with the fixture, encoding copies the WAV it is given.
std::string PassThrough(const fs::path &fixture) {
    return fmt::format(R"(in=""; prev=""
for a in "$@"; do
    if [ "$prev" = "-i" ]; then in="$a"; fi
    prev="$a"
done
case "$prev" in
    *.in.wav) cp '{}' "$prev" ;;
    *) cp "$in" "$prev" ;;
esac)",
                       fixture.string());
}

} // namespace

TEST_CASE("NormalizeFile bridged") {
    CapturedLog log;
    const Options options;
    const auto dir = CleanOutputDir("media_bridged");
    const auto fixture = BridgeFixture();

    SECTION("MP3 round trip through the transcoder") {
        const auto path = dir / "voice.mp3";
        WriteBytes(path, "mp3 bytes");
        const FakeTool ffmpeg("ffmpeg", PassThrough(fixture));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));
        REQUIRE(std::get<Success>(outcome).Gain == Catch::Approx(7.0).margin(0.05));

        const auto calls = ffmpeg.Calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(Contains(calls[0], {"-i", path.string()}));
        REQUIRE(Contains(calls[0], {"-acodec", "pcm_s16le", "-ar", "48000", "-ac", "2"}));
        REQUIRE(Contains(calls[1], {"-acodec", "libmp3lame", "-b:a", "192k"}));
        REQUIRE(calls[1].back() == narratune::PartialPath(path).string());

        REQUIRE(std::abs(Loudness::Measure(Audio::Decode(path).Pcm) + 16.0) < 0.5);
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.mp3"});
    }

    SECTION("M4A is encoded back with aac") {
        const auto path = dir / "voice.m4a";
        WriteBytes(path, "m4a bytes");
        const FakeTool ffmpeg("ffmpeg", PassThrough(fixture));

        REQUIRE(std::holds_alternative<Success>(NormalizeFile(path, options, *log.Logger)));
        const auto calls = ffmpeg.Calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(Contains(calls[1], {"-acodec", "aac", "-b:a", "192k"}));
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.m4a"});
    }

    SECTION("Failed conversion to WAV leaves nothing behind") {
        const auto path = dir / "voice.wma";
        WriteBytes(path, "wma bytes");
        const FakeTool ffmpeg("ffmpeg", "echo 'Invalid data found' >&2; exit 1");

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Failed>(outcome));
        REQUIRE(std::get<Failed>(outcome).Reason.find("Invalid data found") != std::string::npos);
        REQUIRE(ReadBytes(path) == "wma bytes");
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.wma"});
    }

    SECTION("Failed conversion back leaves the original and no temporary files") {
        const auto path = dir / "voice.aac";
        WriteBytes(path, "aac bytes");
        const FakeTool ffmpeg("ffmpeg", fmt::format(R"(for last; do :; done
case "$last" in
    *.wav) cp '{}' "$last" ;;
    *) echo 'Unknown encoder' >&2; exit 1 ;;
esac)",
                                                    fixture.string()));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Failed>(outcome));
        REQUIRE(ffmpeg.Calls().size() == 2);
        REQUIRE(ReadBytes(path) == "aac bytes");
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.aac"});
    }

    SECTION("Silent audio is skipped before encoding back") {
        const auto silent = GetOutputPath("bridge_silent.wav");
        Audio::Encode(MakeSine(48000, 2, 2.0, 997.0, 0.0), silent, Audio::FMT_PCM_S16LE);
        const auto path = dir / "pause.mp3";
        WriteBytes(path, "mp3 bytes");
        const FakeTool ffmpeg("ffmpeg", PassThrough(silent));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Skipped>(outcome));
        REQUIRE(ffmpeg.Calls().size() == 1);
        REQUIRE(ReadBytes(path) == "mp3 bytes");
        REQUIRE(Listing(dir) == std::vector<std::string>{"pause.mp3"});
    }
}

TEST_CASE("NormalizeFile through ffmpeg") {
    if (!HaveFFmpeg()) {
        SKIP("ffmpeg is not installed");
    }

    CapturedLog log;
    const Options options;
    const auto dir = CleanOutputDir("media_ffmpeg");
    const auto fixture = BridgeFixture();

    SECTION("MP3") {
        const auto path = dir / "voice.mp3";
        Transcode::FromPcm(fixture, path, BridgeEncoder(CodecFamily::Mp3));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));
        REQUIRE(std::get<Success>(outcome).Gain == Catch::Approx(7.0).margin(0.5));

        const auto decoded = Audio::Decode(path);
        REQUIRE(decoded.Info.CodecId == AV_CODEC_ID_MP3);
        REQUIRE(std::abs(Loudness::Measure(decoded.Pcm) + 16.0) < 0.5);
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.mp3"});
    }

    SECTION("M4A") {
        const auto path = dir / "voice.m4a";
        Transcode::FromPcm(fixture, path, BridgeEncoder(CodecFamily::M4a));

        const auto outcome = NormalizeFile(path, options, *log.Logger);
        REQUIRE(std::holds_alternative<Success>(outcome));

        const auto decoded = Audio::Decode(path);
        REQUIRE(decoded.Info.CodecId == AV_CODEC_ID_AAC);
        REQUIRE(std::abs(Loudness::Measure(decoded.Pcm) + 16.0) < 0.5);
        REQUIRE(Listing(dir) == std::vector<std::string>{"voice.m4a"});
    }
}
