#pragma once

#include "command.hpp"
#include "lib.hpp"
#include "process.hpp"

#include <optional>
#include <string>

namespace Transcode {

// ffmpeg encoder arguments for the way back from intermediate PCM.
struct EncoderSpec {
    std::string Codec = "copy";
    std::optional<std::string> Bitrate;
};

// Throws narratune::TranscodeError when ffmpeg cannot be executed.
void EnsureAvailable();

// Any input to 48 kHz stereo 16-bit WAV.
void ToPcm(const fs::path &src, const fs::path &dstWav);

void FromPcm(const fs::path &srcWav, const fs::path &dst, const EncoderSpec &encoder);

} // namespace Transcode
