#pragma once

#include "lib.hpp"

#include <string>

namespace Video {

inline const std::string VIDEO_EXTENSION = ".mp4";
inline const std::string REMUX_AUDIO_CODEC = "aac";
inline const std::string REMUX_AUDIO_BITRATE = "192k";

struct VideoInfo {
    fs::path Path;
    bool HasVideo = false;
    bool HasAudio = false;
    std::string VideoCodec;
    std::string AudioCodec;
    double Duration = 0.0; // longest stream, seconds
};

// Job stages, in order. A failure in Probing or ExtractingAudio leaves no output behind.
enum class Stage {
    Probing,
    ExtractingAudio,
    Normalizing,
    Remuxing,
    Done,
};

const char *ToString(Stage stage);

// Reads ffprobe's "-show_entries stream=codec_type,codec_name,duration -of json" output.
VideoInfo ParseProbe(const fs::path &path, const std::string &json);

VideoInfo Probe(const fs::path &path);

// Throws ValidationError unless the file is an existing .mp4 with both a video and an audio stream.
VideoInfo Validate(const fs::path &path);

// 48 kHz stereo 16-bit PCM WAV of the audio track.
void ExtractAudio(const fs::path &videoPath, const fs::path &wavPath);

void ReplaceAudio(const fs::path &videoPath, const fs::path &wavPath, const fs::path &outputPath);

} // namespace Video
