#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

#include <fmt/format.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "audio.hpp"
#include "lib.hpp"

namespace av {
inline std::string ErrorString(const int err) {
    char txt[AV_ERROR_MAX_STRING_SIZE]{};
    av_strerror(err, txt, sizeof(txt));
    return txt;
}

// Throws a FileError naming path when err is a libav error code.
template <typename... Args>
void Assert(const int err, const fs::path &path, fmt::format_string<Args...> msg_fmt, Args &&...args) {
    if (err < 0) {
        const auto msg = fmt::format(msg_fmt, std::forward<Args>(args)...);
        throw narratune::FileError(path, fmt::format("{} (ffmpeg: {})", msg, ErrorString(err)));
    }
}

template <typename... Args>
void Assert(const int err, fmt::format_string<Args...> msg_fmt, Args &&...args) {
    if (err < 0) {
        const auto msg = fmt::format(msg_fmt, std::forward<Args>(args)...);
        throw std::runtime_error(fmt::format("{} (ffmpeg: {})", msg, ErrorString(err)));
    }
}

template <typename... Args>
void Ensure(const bool cond, fmt::format_string<Args...> msg_fmt, Args &&...args) {
    if (!cond) {
        throw std::runtime_error(fmt::format(msg_fmt, std::forward<Args>(args)...));
    }
}

// Deleter for the libav types released through a T** free function.
template <typename T, void (*Free)(T **)>
struct FreeWith {
    void operator()(T *ptr) const { Free(&ptr); }
};
} // namespace av

namespace Audio {

using AVFormatInputContextPtr = std::unique_ptr<AVFormatContext, av::FreeWith<AVFormatContext, avformat_close_input>>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, av::FreeWith<AVCodecContext, avcodec_free_context>>;
using AVFilterGraphPtr = std::unique_ptr<AVFilterGraph, av::FreeWith<AVFilterGraph, avfilter_graph_free>>;
using AVPacketPtr = std::unique_ptr<AVPacket, av::FreeWith<AVPacket, av_packet_free>>;
using AVFramePtr = std::unique_ptr<AVFrame, av::FreeWith<AVFrame, av_frame_free>>;

// Output contexts own their I/O handle separately.
struct AVFormatOutputContextDeleter {
    void operator()(AVFormatContext *ctx) const {
        if (ctx) {
            avio_closep(&ctx->pb);
            avformat_free_context(ctx);
        }
    }
};
using AVFormatOutputContextPtr = std::unique_ptr<AVFormatContext, AVFormatOutputContextDeleter>;

// Receives every frame that leaves the filter graph.
using FrameSink = std::function<void(const AVFramePtr &)>;

// Reading

inline AVFormatInputContextPtr OpenInput(const fs::path &path) {
    AVFormatContext *raw = nullptr;
    av::Assert(avformat_open_input(&raw, path.string().c_str(), nullptr, nullptr), path, "Cannot open audio file");
    AVFormatInputContextPtr ctx(raw);
    av::Assert(avformat_find_stream_info(ctx.get(), nullptr), path, "Cannot read stream info");
    return ctx;
}

inline AVStream *FindAudioStream(const AVFormatInputContextPtr &ctx, const fs::path &path) {
    const int index = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    av::Assert(index, path, "No audio stream");
    return ctx->streams[index];
}

inline AVCodecContextPtr OpenDecoder(const AVStream *st) {
    const AVCodec *codec = avcodec_find_decoder(st->codecpar->codec_id);
    av::Ensure(codec, "No decoder for {}", avcodec_get_name(st->codecpar->codec_id));

    AVCodecContextPtr ctx(avcodec_alloc_context3(codec));
    av::Ensure(ctx.get(), "Failed to allocate decoder context");
    av::Assert(avcodec_parameters_to_context(ctx.get(), st->codecpar), "Failed to copy stream parameters");
    ctx->pkt_timebase = st->time_base;
    av::Assert(avcodec_open2(ctx.get(), codec, nullptr), "Failed to open decoder: {}", codec->name);

    // Raw formats may come without a layout; the buffer source needs one.
    if (ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || ctx->ch_layout.nb_channels == 0) {
        const int channels =
                ctx->ch_layout.nb_channels > 0 ? ctx->ch_layout.nb_channels : st->codecpar->ch_layout.nb_channels;
        av::Ensure(channels > 0, "Audio stream has no channels");
        av_channel_layout_uninit(&ctx->ch_layout);
        av_channel_layout_default(&ctx->ch_layout, channels);
    }
    return ctx;
}

// Writing

// The muxer follows the file extension.
inline AVFormatOutputContextPtr OpenOutput(const fs::path &path) {
    AVFormatContext *raw = nullptr;
    av::Assert(avformat_alloc_output_context2(&raw, nullptr, nullptr, path.string().c_str()), path,
               "No muxer for this file type");
    return AVFormatOutputContextPtr(raw);
}

inline const AVCodec *FindEncoder(const EncodeFormat &target) {
    const AVCodec *codec = target.EncoderName ? avcodec_find_encoder_by_name(target.EncoderName) : nullptr;
    if (!codec) {
        codec = avcodec_find_encoder(target.CodecId);
    }
    av::Ensure(codec, "No encoder for {}", avcodec_get_name(target.CodecId));
    return codec;
}

// The requested format when the encoder takes it, otherwise the encoder's first choice.
inline AVSampleFormat PickSampleFormat(const AVCodec *codec, const AVSampleFormat wanted) {
    if (!codec->sample_fmts) {
        return wanted;
    }
    for (const AVSampleFormat *f = codec->sample_fmts; *f != AV_SAMPLE_FMT_NONE; ++f) {
        if (*f == wanted) {
            return wanted;
        }
    }
    return codec->sample_fmts[0];
}

inline AVCodecContextPtr OpenEncoder(const EncodeFormat &target, const int sampleRate, const int channels,
                                     const AVFormatOutputContextPtr &ofmt) {
    const AVCodec *codec = FindEncoder(target);
    AVCodecContextPtr ctx(avcodec_alloc_context3(codec));
    av::Ensure(ctx.get(), "Failed to allocate encoder context");

    ctx->sample_rate = sampleRate;
    av_channel_layout_default(&ctx->ch_layout, channels);
    ctx->sample_fmt = PickSampleFormat(codec, target.SampleFormat);
    ctx->bit_rate = target.BitRate;
    ctx->bits_per_raw_sample = target.BitsPerRawSample;
    ctx->time_base = AVRational{1, sampleRate};
    ctx->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    if (ofmt->oformat->flags & AVFMT_GLOBALHEADER) {
        ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    av::Assert(avcodec_open2(ctx.get(), codec, nullptr), "Failed to open encoder: {}", codec->name);
    return ctx;
}

// Adds the single audio stream, opens the file and writes the header.
inline AVStream *BeginOutput(const fs::path &path, const AVFormatOutputContextPtr &ofmt,
                             const AVCodecContextPtr &ectx) {
    AVStream *st = avformat_new_stream(ofmt.get(), nullptr);
    av::Ensure(st, "Failed to create output stream");
    st->time_base = ectx->time_base;
    av::Assert(avcodec_parameters_from_context(st->codecpar, ectx.get()), "Failed to copy encoder parameters");

    if (!(ofmt->oformat->flags & AVFMT_NOFILE)) {
        av::Assert(avio_open(&ofmt->pb, path.string().c_str(), AVIO_FLAG_WRITE), path, "Cannot create file");
    }
    av::Assert(avformat_write_header(ofmt.get(), nullptr), path, "Cannot write header");
    return st;
}

// Filtering

inline AVFilterContext *AllocFilter(const AVFilterGraphPtr &graph, const char *name, const char *instance) {
    const AVFilter *filter = avfilter_get_by_name(name);
    av::Ensure(filter, "Filter not available: {}", name);
    AVFilterContext *ctx = avfilter_graph_alloc_filter(graph.get(), filter, instance);
    av::Ensure(ctx, "Failed to allocate filter: {}", name);
    return ctx;
}

// Creates, initializes and links a filter after from.
inline AVFilterContext *Filter(const AVFilterGraphPtr &graph, AVFilterContext *from, const char *name,
                               const char *instance, const std::string &opts = {}) {
    AVFilterContext *ctx = AllocFilter(graph, name, instance);
    av::Assert(avfilter_init_str(ctx, opts.empty() ? nullptr : opts.c_str()), "Failed to initialize filter: {}", name);
    av::Assert(avfilter_link(from, 0, ctx, 0), "Failed to link filter: {}", name);
    return ctx;
}

inline AVFilterContext *BufferSource(const AVFilterGraphPtr &graph, const AVSampleFormat format, const int sampleRate,
                                     const AVChannelLayout &layout, const AVRational timeBase) {
    AVFilterContext *src = AllocFilter(graph, "abuffer", "in");

    std::unique_ptr<AVBufferSrcParameters, decltype(&av_free)> par(av_buffersrc_parameters_alloc(), &av_free);
    av::Ensure(par.get(), "Failed to allocate buffer source parameters");
    par->format = format;
    par->sample_rate = sampleRate;
    par->time_base = timeBase;
    av::Assert(av_channel_layout_copy(&par->ch_layout, &layout), "Failed to copy channel layout");

    const int ret = av_buffersrc_parameters_set(src, par.get());
    av_channel_layout_uninit(&par->ch_layout);
    av::Assert(ret, "Failed to configure buffer source");
    av::Assert(avfilter_init_str(src, nullptr), "Failed to initialize buffer source");
    return src;
}

// Hands every frame the sink has ready to the callback.
inline void DrainSink(AVFilterContext *fsnk, const AVFramePtr &ffrm, const FrameSink &sink) {
    while (av_buffersink_get_frame(fsnk, ffrm.get()) == 0) {
        sink(ffrm);
        av_frame_unref(ffrm.get());
    }
}

// Encodes one frame and writes out the packets; a null frame flushes the encoder.
inline void EncodeFrame(const AVFramePtr &frm, const AVCodecContextPtr &ectx, const AVFormatOutputContextPtr &ofmt,
                        const AVPacketPtr &pkt, const AVStream *ost) {
    av::Assert(avcodec_send_frame(ectx.get(), frm.get()), "Encoder rejected frame: {}", ectx->codec->name);
    while (avcodec_receive_packet(ectx.get(), pkt.get()) == 0) {
        av_packet_rescale_ts(pkt.get(), ectx->time_base, ost->time_base);
        pkt->stream_index = ost->index;
        av::Assert(av_interleaved_write_frame(ofmt.get(), pkt.get()), "Failed to write packet: {}",
                   ofmt->oformat->name);
    }
}

// Pulls every decoded frame through the filter graph.
inline void DecodeFrames(const AVCodecContextPtr &dctx, AVFilterContext *fsrc, AVFilterContext *fsnk,
                         const AVFramePtr &dfrm, const AVFramePtr &ffrm, const FrameSink &sink) {
    for (;;) {
        const int ret = avcodec_receive_frame(dctx.get(), dfrm.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return;
        }
        av::Assert(ret, "Decoder failed: {}", dctx->codec->name);
        av::Assert(av_buffersrc_add_frame(fsrc, dfrm.get()), "Failed to feed filter graph");
        DrainSink(fsnk, ffrm, sink);
    }
}

} // namespace Audio
