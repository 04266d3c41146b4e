#include "video.hpp"
#include "audio/audio.hpp"
#include "transcode/transcode.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace Video {

const char *ToString(const Stage stage) {
    switch (stage) {
    case Stage::Probing:
        return "probing";
    case Stage::ExtractingAudio:
        return "extracting audio";
    case Stage::Normalizing:
        return "normalizing";
    case Stage::Remuxing:
        return "remuxing";
    case Stage::Done:
        return "done";
    }
    return "unknown";
}

VideoInfo ParseProbe(const fs::path &path, const std::string &json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error &e) {
        throw narratune::ValidationError(path, fmt::format("Unreadable ffprobe output: {}", e.what()));
    }

    VideoInfo info;
    info.Path = path;
    if (!doc.is_object() || !doc.contains("streams") || !doc["streams"].is_array()) {
        return info;
    }

    for (const auto &stream : doc["streams"]) {
        const auto type = stream.value("codec_type", std::string{});
        const auto name = stream.value("codec_name", std::string{});

        if (type == "video") {
            info.HasVideo = true;
            info.VideoCodec = name;
        } else if (type == "audio") {
            info.HasAudio = true;
            info.AudioCodec = name;
        } else {
            continue;
        }

        // ffprobe reports durations as decimal strings
        if (stream.contains("duration") && stream["duration"].is_string()) {
            const auto text = stream["duration"].get<std::string>();
            char *end = nullptr;
            const double duration = std::strtod(text.c_str(), &end);
            if (end != text.c_str() && std::isfinite(duration)) {
                info.Duration = std::max(info.Duration, duration);
            }
        }
    }
    return info;
}

VideoInfo Probe(const fs::path &path) {
    const auto argv = Transcode::Command::FFprobe()
                          .LogLevel("error")
                          .ShowEntries("stream=codec_type,codec_name,duration")
                          .PrintFormat("json")
                          .Input(path)
                          .Build();
    const auto result = Transcode::RunChecked(argv);
    return ParseProbe(path, result.Out);
}

VideoInfo Validate(const fs::path &path) {
    if (!fs::exists(path)) {
        throw narratune::ValidationError(path, "File not found");
    }
    if (!fs::is_regular_file(path)) {
        throw narratune::ValidationError(path, "Not a file");
    }
    if (narratune::ToLower(path.extension().string()) != VIDEO_EXTENSION) {
        throw narratune::ValidationError(
                path, fmt::format("Unsupported format: {} (only {} supported)", path.extension().string(), VIDEO_EXTENSION));
    }

    VideoInfo info;
    try {
        info = Probe(path);
    } catch (const narratune::TranscodeError &e) {
        throw narratune::ValidationError(path, fmt::format("Failed to probe video file: {}", e.what()));
    }

    if (!info.HasVideo) {
        throw narratune::ValidationError(path, "No video stream found");
    }
    if (!info.HasAudio) {
        throw narratune::ValidationError(path, "No audio stream found");
    }
    return info;
}

void ExtractAudio(const fs::path &videoPath, const fs::path &wavPath) {
    const auto argv = Transcode::Command::FFmpeg()
                          .Input(videoPath)
                          .NoVideo()
                          .AudioCodec("pcm_s16le")
                          .SampleRate(Audio::BRIDGE_SAMPLE_RATE)
                          .Channels(Audio::BRIDGE_CHANNELS)
                          .Overwrite()
                          .LogLevel("error")
                          .Output(wavPath)
                          .Build();
    Transcode::RunChecked(argv);
}

void ReplaceAudio(const fs::path &videoPath, const fs::path &wavPath, const fs::path &outputPath) {
    if (outputPath.has_parent_path()) {
        fs::create_directories(outputPath.parent_path());
    }
    const narratune::TempFile partial(narratune::PartialPath(outputPath));

    const auto argv = Transcode::Command::FFmpeg()
                          .Input(videoPath)
                          .Input(wavPath)
                          .VideoCodec("copy")
                          .AudioCodec(REMUX_AUDIO_CODEC)
                          .AudioBitrate(REMUX_AUDIO_BITRATE)
                          .Map("0:v:0")
                          .Map("1:a:0")
                          .Shortest()
                          .Overwrite()
                          .LogLevel("error")
                          .Output(partial.Path())
                          .Build();
    Transcode::RunChecked(argv);

    narratune::CommitOutput(partial.Path(), outputPath);
}

} // namespace Video
