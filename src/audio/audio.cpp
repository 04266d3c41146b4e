extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
}

#include "audio.hpp"
#include "lib.hpp"
#include "utils.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

inline int spdlog_to_av_level(const spdlog::level::level_enum lvl) {
    switch (lvl) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return AV_LOG_DEBUG;
    case spdlog::level::info:
        // libav chatter at info level drowns the per-file report
        return AV_LOG_WARNING;
    case spdlog::level::warn:
        return AV_LOG_WARNING;
    case spdlog::level::err:
        return AV_LOG_ERROR;
    case spdlog::level::critical:
        return AV_LOG_FATAL;
    case spdlog::level::off:
        return AV_LOG_QUIET;
    default:
        return AV_LOG_INFO;
    }
}

void Audio::Initialize(const spdlog::level::level_enum level) {
    av_log_set_level(spdlog_to_av_level(level));
}

Audio::DecodedAudio Audio::Decode(const fs::path &path) {
    const auto ifmt = OpenInput(path);
    const auto ist = FindAudioStream(ifmt, path);
    const auto dctx = OpenDecoder(ist);

    DecodedAudio out{};
    out.Info.CodecId = dctx->codec_id;
    out.Info.SampleFormat = dctx->sample_fmt;
    out.Info.SampleRate = dctx->sample_rate;
    out.Info.Channels = dctx->ch_layout.nb_channels;
    out.Info.BitsPerRawSample = dctx->bits_per_raw_sample;
    out.Info.BitRate = dctx->bit_rate;

    av::Ensure(out.Info.SampleRate > 0, "Invalid sample rate in {}", path.filename().string());

    out.Pcm.SampleRate = out.Info.SampleRate;
    out.Pcm.Channels.resize(out.Info.Channels);

    const AVFilterGraphPtr graph(avfilter_graph_alloc());
    av::Ensure(graph.get(), "Failed to allocate filter graph");

    AVFilterContext *fsrc = BufferSource(graph, dctx->sample_fmt, dctx->sample_rate, dctx->ch_layout, ist->time_base);
    AVFilterContext *conv = Filter(graph, fsrc, "aformat", "aformat", "sample_fmts=fltp");
    AVFilterContext *fsnk = Filter(graph, conv, "abuffersink", "out");

    auto ret = avfilter_graph_config(graph.get(), nullptr);
    av::Assert(ret, "Failed to configure filter graph for decoding");

    const AVPacketPtr pkt(av_packet_alloc());
    const AVFramePtr dfrm(av_frame_alloc());
    const AVFramePtr ffrm(av_frame_alloc());
    av::Ensure(pkt && dfrm && ffrm, "Failed to allocate packet or frame");

    const FrameSink append = [&out](const AVFramePtr &frm) {
        const int channels = std::min(frm->ch_layout.nb_channels, out.Pcm.ChannelCount());
        for (int c = 0; c < channels; ++c) {
            const auto *data = reinterpret_cast<const float *>(frm->extended_data[c]);
            auto &dst = out.Pcm.Channels[c];
            dst.insert(dst.end(), data, data + frm->nb_samples);
        }
    };

    while (av_read_frame(ifmt.get(), pkt.get()) >= 0) {
        if (pkt->stream_index != ist->index) {
            av_packet_unref(pkt.get());
            continue;
        }

        ret = avcodec_send_packet(dctx.get(), pkt.get());
        av::Assert(ret, "Failed to send packet to decoder: {}", dctx->codec->name);
        av_packet_unref(pkt.get());
        DecodeFrames(dctx, fsrc, fsnk, dfrm, ffrm, append);
    }

    ret = avcodec_send_packet(dctx.get(), nullptr);
    av::Assert(ret, "Failed to send end-of-stream packet to decoder: {}", dctx->codec->name);
    DecodeFrames(dctx, fsrc, fsnk, dfrm, ffrm, append);

    ret = av_buffersrc_add_frame(fsrc, nullptr);
    av::Assert(ret, "Failed to add end-of-stream frame to buffer source: {}", fsrc->filter->name);
    DrainSink(fsnk, ffrm, append);

    return out;
}

Audio::EncodeFormat Audio::SameAs(const StreamInfo &info) {
    EncodeFormat fmt{info.CodecId, info.SampleFormat, info.BitRate, info.BitsPerRawSample, nullptr};
    if (info.CodecId == AV_CODEC_ID_VORBIS) {
        fmt.EncoderName = "libvorbis";
    }
    // PCM and FLAC are sized by the sample format, not a bitrate
    if (info.CodecId == AV_CODEC_ID_FLAC || av_get_exact_bits_per_sample(info.CodecId) > 0) {
        fmt.BitRate = 0;
    }
    return fmt;
}

void Audio::Encode(const PcmBuffer &pcm, const fs::path &dstPath, const EncodeFormat &target) {
    av::Ensure(pcm.ChannelCount() > 0, "Cannot encode audio without channels: {}", dstPath.filename().string());
    av::Ensure(pcm.SampleRate > 0, "Cannot encode audio without a sample rate: {}", dstPath.filename().string());

    const auto ofmt = OpenOutput(dstPath);
    const auto ectx = OpenEncoder(target, pcm.SampleRate, pcm.ChannelCount(), ofmt);
    const AVStream *ost = BeginOutput(dstPath, ofmt, ectx);

    AVChannelLayout layout{};
    av_channel_layout_default(&layout, pcm.ChannelCount());
    const AVRational timeBase{1, pcm.SampleRate};

    const AVFilterGraphPtr graph(avfilter_graph_alloc());
    av::Ensure(graph.get(), "Failed to allocate filter graph");

    AVFilterContext *fsrc = BufferSource(graph, AV_SAMPLE_FMT_FLTP, pcm.SampleRate, layout, timeBase);
    AVFilterContext *conv = Filter(graph, fsrc, "aformat", "aformat",
                                   fmt::format("sample_fmts={}", av_get_sample_fmt_name(ectx->sample_fmt)));
    AVFilterContext *fsnk = Filter(graph, conv, "abuffersink", "out");

    auto ret = avfilter_graph_config(graph.get(), nullptr);
    av::Assert(ret, "Failed to configure filter graph for encoding");

    if (ectx->frame_size > 0 && !(ectx->codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE)) {
        av_buffersink_set_frame_size(fsnk, ectx->frame_size);
    }

    const AVPacketPtr pkt(av_packet_alloc());
    const AVFramePtr frm(av_frame_alloc());
    const AVFramePtr ffrm(av_frame_alloc());
    av::Ensure(pkt && frm && ffrm, "Failed to allocate packet or frame");

    const FrameSink encode = [&](const AVFramePtr &f) { EncodeFrame(f, ectx, ofmt, pkt, ost); };

    constexpr size_t chunk = 1024;
    const size_t frames = pcm.Frames();
    for (size_t offset = 0; offset < frames; offset += chunk) {
        const size_t n = std::min(chunk, frames - offset);

        frm->format = AV_SAMPLE_FMT_FLTP;
        frm->sample_rate = pcm.SampleRate;
        frm->nb_samples = static_cast<int>(n);
        frm->pts = static_cast<int64_t>(offset);
        ret = av_channel_layout_copy(&frm->ch_layout, &layout);
        av::Assert(ret, "Failed to set frame channel layout");
        ret = av_frame_get_buffer(frm.get(), 0);
        av::Assert(ret, "Failed to allocate frame buffer");

        for (int c = 0; c < pcm.ChannelCount(); ++c) {
            std::copy_n(pcm.Channels[c].data() + offset, n, reinterpret_cast<float *>(frm->extended_data[c]));
        }

        ret = av_buffersrc_add_frame(fsrc, frm.get());
        av::Assert(ret, "Failed to add frame to buffer source: {}", fsrc->filter->name);
        av_frame_unref(frm.get());

        DrainSink(fsnk, ffrm, encode);
    }
    av_channel_layout_uninit(&layout);

    ret = av_buffersrc_add_frame(fsrc, nullptr);
    av::Assert(ret, "Failed to add end-of-stream frame to buffer source: {}", fsrc->filter->name);
    DrainSink(fsnk, ffrm, encode);

    EncodeFrame(AVFramePtr{}, ectx, ofmt, pkt, ost);

    ret = av_write_trailer(ofmt.get());
    av::Assert(ret, "Failed to write trailer to output format: {}", ofmt->oformat->name);
}
