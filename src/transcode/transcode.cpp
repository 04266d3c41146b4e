#include "transcode.hpp"
#include "audio/audio.hpp"

namespace Transcode {

void EnsureAvailable() {
    RunChecked({ProgramName(Tool::FFmpeg), "-version"});
}

void ToPcm(const fs::path &src, const fs::path &dstWav) {
    const auto argv = Command::FFmpeg()
                          .Input(src)
                          .Overwrite()
                          .AudioCodec("pcm_s16le")
                          .SampleRate(Audio::BRIDGE_SAMPLE_RATE)
                          .Channels(Audio::BRIDGE_CHANNELS)
                          .LogLevel("error")
                          .Output(dstWav)
                          .Build();
    RunChecked(argv);
}

void FromPcm(const fs::path &srcWav, const fs::path &dst, const EncoderSpec &encoder) {
    auto cmd = Command::FFmpeg();
    cmd.Input(srcWav).Overwrite().AudioCodec(encoder.Codec);
    if (encoder.Bitrate) {
        cmd.AudioBitrate(*encoder.Bitrate);
    }
    RunChecked(cmd.LogLevel("error").Output(dst).Build());
}

} // namespace Transcode
