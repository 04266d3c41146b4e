#pragma once

#include "lib.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Transcode {

enum class Tool {
    FFmpeg,
    FFprobe,
};

// Build() throws std::invalid_argument for an incomplete or mixed invocation.
class Command {
public:
    static Command FFmpeg() { return Command(Tool::FFmpeg); }
    static Command FFprobe() { return Command(Tool::FFprobe); }

    Command &Input(const fs::path &path);
    Command &Output(const fs::path &path);
    Command &Overwrite();
    Command &LogLevel(std::string level);
    Command &NoVideo();
    Command &AudioCodec(std::string codec);
    Command &AudioBitrate(std::string bitrate);
    Command &VideoCodec(std::string codec);
    Command &SampleRate(int rate);
    Command &Channels(int channels);
    Command &Map(std::string spec);
    Command &Shortest();
    Command &ShowEntries(std::string entries);
    Command &PrintFormat(std::string format);

    [[nodiscard]] std::vector<std::string> Build() const;

private:
    explicit Command(const Tool tool) : m_tool(tool) {}

    void ValidateFFmpeg() const;
    void ValidateFFprobe() const;

    Tool m_tool;
    std::vector<fs::path> m_inputs;
    std::optional<fs::path> m_output;
    bool m_overwrite = false;
    bool m_noVideo = false;
    bool m_shortest = false;
    std::optional<std::string> m_logLevel;
    std::optional<std::string> m_audioCodec;
    std::optional<std::string> m_audioBitrate;
    std::optional<std::string> m_videoCodec;
    std::optional<int> m_sampleRate;
    std::optional<int> m_channels;
    std::vector<std::string> m_maps;
    std::optional<std::string> m_showEntries;
    std::optional<std::string> m_printFormat;
};

const char *ProgramName(Tool tool);

} // namespace Transcode
