#include "command.hpp"

#include <stdexcept>

namespace Transcode {

const char *ProgramName(const Tool tool) {
    switch (tool) {
    case Tool::FFmpeg:
        return "ffmpeg";
    case Tool::FFprobe:
        return "ffprobe";
    }
    return "ffmpeg";
}

Command &Command::Input(const fs::path &path) {
    m_inputs.push_back(path);
    return *this;
}

Command &Command::Output(const fs::path &path) {
    m_output = path;
    return *this;
}

Command &Command::Overwrite() {
    m_overwrite = true;
    return *this;
}

Command &Command::LogLevel(std::string level) {
    m_logLevel = std::move(level);
    return *this;
}

Command &Command::NoVideo() {
    m_noVideo = true;
    return *this;
}

Command &Command::AudioCodec(std::string codec) {
    m_audioCodec = std::move(codec);
    return *this;
}

Command &Command::AudioBitrate(std::string bitrate) {
    m_audioBitrate = std::move(bitrate);
    return *this;
}

Command &Command::VideoCodec(std::string codec) {
    m_videoCodec = std::move(codec);
    return *this;
}

Command &Command::SampleRate(const int rate) {
    m_sampleRate = rate;
    return *this;
}

Command &Command::Channels(const int channels) {
    m_channels = channels;
    return *this;
}

Command &Command::Map(std::string spec) {
    m_maps.push_back(std::move(spec));
    return *this;
}

Command &Command::Shortest() {
    m_shortest = true;
    return *this;
}

Command &Command::ShowEntries(std::string entries) {
    m_showEntries = std::move(entries);
    return *this;
}

Command &Command::PrintFormat(std::string format) {
    m_printFormat = std::move(format);
    return *this;
}

void Command::ValidateFFmpeg() const {
    if (m_inputs.empty()) {
        throw std::invalid_argument("ffmpeg command has no input");
    }
    if (!m_output) {
        throw std::invalid_argument("ffmpeg command has no output");
    }
    if (!m_overwrite) {
        throw std::invalid_argument("ffmpeg command must overwrite explicitly");
    }
    if (!m_logLevel) {
        throw std::invalid_argument("ffmpeg command has no log level");
    }
    if (m_audioCodec && m_audioCodec->rfind("pcm_", 0) == 0 && (!m_sampleRate || !m_channels)) {
        throw std::invalid_argument("ffmpeg PCM encode needs an explicit sample rate and channel count");
    }
    if ((m_sampleRate && *m_sampleRate <= 0) || (m_channels && *m_channels <= 0)) {
        throw std::invalid_argument("ffmpeg sample rate and channel count must be positive");
    }
    if (m_showEntries || m_printFormat) {
        throw std::invalid_argument("ffmpeg command cannot take ffprobe options");
    }
}

void Command::ValidateFFprobe() const {
    if (m_inputs.size() != 1) {
        throw std::invalid_argument("ffprobe command needs exactly one input");
    }
    if (!m_printFormat) {
        throw std::invalid_argument("ffprobe command has no output format");
    }
    if (m_output || m_overwrite || m_audioCodec || m_videoCodec || !m_maps.empty()) {
        throw std::invalid_argument("ffprobe command cannot take ffmpeg options");
    }
}

std::vector<std::string> Command::Build() const {
    std::vector<std::string> args{ProgramName(m_tool)};

    if (m_tool == Tool::FFprobe) {
        ValidateFFprobe();
        if (m_logLevel) {
            args.insert(args.end(), {"-v", *m_logLevel});
        }
        if (m_showEntries) {
            args.insert(args.end(), {"-show_entries", *m_showEntries});
        }
        args.insert(args.end(), {"-of", *m_printFormat, m_inputs.front().string()});
        return args;
    }

    ValidateFFmpeg();
    args.emplace_back("-nostdin");
    for (const auto &input : m_inputs) {
        args.insert(args.end(), {"-i", input.string()});
    }
    args.emplace_back("-y");
    if (m_noVideo) {
        args.emplace_back("-vn");
    }
    if (m_videoCodec) {
        args.insert(args.end(), {"-c:v", *m_videoCodec});
    }
    if (m_audioCodec) {
        args.insert(args.end(), {"-acodec", *m_audioCodec});
    }
    if (m_audioBitrate) {
        args.insert(args.end(), {"-b:a", *m_audioBitrate});
    }
    if (m_sampleRate) {
        args.insert(args.end(), {"-ar", std::to_string(*m_sampleRate)});
    }
    if (m_channels) {
        args.insert(args.end(), {"-ac", std::to_string(*m_channels)});
    }
    for (const auto &map : m_maps) {
        args.insert(args.end(), {"-map", map});
    }
    if (m_shortest) {
        args.emplace_back("-shortest");
    }
    args.insert(args.end(), {"-loglevel", *m_logLevel, m_output->string()});
    return args;
}

} // namespace Transcode
