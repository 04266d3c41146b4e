#pragma once

#include <catch2/catch_all.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <numbers>
#include <sstream>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <string>
#include <vector>

#include "audio/audio.hpp"
#include "lib.hpp"
#include "tests/asset.h"
#include "transcode/transcode.hpp"

inline fs::path GetPath(const std::string &filename, const std::string &subdir = "") {
    auto base = fs::path(TEST_ASSET_DIR) / subdir;
    return filename.empty() ? base : base / filename;
}

inline fs::path GetInputPath(const std::string &filename = "") {
    return GetPath(filename);
}

inline fs::path GetOutputPath(const std::string &filename = "") {
    return GetPath(filename, "tmp");
}

inline void Setup() {
    for (const auto &dir : {GetInputPath(), GetOutputPath()}) {
        if (!fs::exists(dir)) {
            fs::create_directories(dir);
        }
    }
}

// Logger writing into a string stream, so tests can look at what was reported.
struct CapturedLog {
    std::ostringstream Stream;
    std::shared_ptr<spdlog::logger> Logger;

    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(Stream);
        Logger = std::make_shared<spdlog::logger>("test", sink);
        Logger->set_level(spdlog::level::debug);
    }

    [[nodiscard]] std::string Text() const { return Stream.str(); }
};

inline Audio::PcmBuffer MakeSine(const int sampleRate, const int channels, const double seconds,
                                 const double frequency, const double amplitude) {
    Audio::PcmBuffer pcm;
    pcm.SampleRate = sampleRate;
    const auto frames = static_cast<size_t>(std::lround(seconds * sampleRate));
    pcm.Channels.assign(channels, std::vector<float>(frames));
    for (size_t i = 0; i < frames; ++i) {
        const double t = static_cast<double>(i) / sampleRate;
        const auto v = static_cast<float>(amplitude * std::sin(2.0 * std::numbers::pi * frequency * t));
        for (auto &channel : pcm.Channels) {
            channel[i] = v;
        }
    }
    return pcm;
}

inline std::string ReadBytes(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void WriteBytes(const fs::path &path, const std::string &bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// Fresh, empty directory below the output path.
inline fs::path CleanOutputDir(const std::string &name) {
    const auto dir = GetOutputPath(name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline bool HaveFFmpeg() {
    try {
        Transcode::EnsureAvailable();
        return true;
    } catch (const narratune::TranscodeError &) {
        return false;
    }
}

// Shell script put first on PATH under the name of a real tool while the object lives.
// Every invocation appends its arguments to a log before the body runs.
class FakeTool {
public:
    FakeTool(const std::string &name, const std::string &body) : m_dir(CleanOutputDir("fake_" + name)) {
        const auto script = m_dir / name;
        WriteBytes(script, fmt::format("#!/bin/sh\n"
                                       "for a in \"$@\"; do printf '%s\\n' \"$a\" >> '{0}'; done\n"
                                       "echo '{1}' >> '{0}'\n"
                                       "{2}\n",
                                       CallLog().string(), END_OF_CALL, body));
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);

        const char *path = std::getenv("PATH");
        m_savedPath = path ? path : "";
        setenv("PATH", (m_dir.string() + ":" + m_savedPath).c_str(), 1);
    }

    ~FakeTool() { setenv("PATH", m_savedPath.c_str(), 1); }

    FakeTool(const FakeTool &) = delete;
    FakeTool &operator=(const FakeTool &) = delete;

    // Arguments of each call, without the program name.
    [[nodiscard]] std::vector<std::vector<std::string>> Calls() const {
        std::vector<std::vector<std::string>> calls;
        std::ifstream in(CallLog());
        std::vector<std::string> current;
        for (std::string line; std::getline(in, line);) {
            if (line == END_OF_CALL) {
                calls.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(line);
            }
        }
        return calls;
    }

private:
    static constexpr const char *END_OF_CALL = "--end-of-call--";

    [[nodiscard]] fs::path CallLog() const { return m_dir / "calls.log"; }

    fs::path m_dir;
    std::string m_savedPath;
};
