extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/tx.h>
}

#include "denoise.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <vector>

namespace Denoise {

namespace {

constexpr int BINS = FFT_SIZE / 2 + 1;

struct AVTXContextDeleter {
    void operator()(AVTXContext *ctx) const { av_tx_uninit(&ctx); }
};
using AVTXContextPtr = std::unique_ptr<AVTXContext, AVTXContextDeleter>;

struct AVMemDeleter {
    void operator()(void *ptr) const { av_free(ptr); }
};

// av_tx wants SIMD-aligned buffers.
template <typename T>
using AlignedPtr = std::unique_ptr<T[], AVMemDeleter>;

template <typename T>
AlignedPtr<T> AllocAligned(const size_t count) {
    auto *raw = static_cast<T *>(av_calloc(count, sizeof(T)));
    if (!raw) {
        throw std::bad_alloc();
    }
    return AlignedPtr<T>(raw);
}

class Transform {
public:
    Transform() : m_real(AllocAligned<float>(FFT_SIZE + 2)), m_spec(AllocAligned<AVComplexFloat>(BINS)) {
        AVTXContext *raw = nullptr;
        float scale = 1.0f;
        int ret = av_tx_init(&raw, &m_fwdFn, AV_TX_FLOAT_RDFT, 0, FFT_SIZE, &scale, 0);
        Check(ret, "forward");
        m_fwd.reset(raw);

        raw = nullptr;
        float invScale = 1.0f / FFT_SIZE;
        ret = av_tx_init(&raw, &m_invFn, AV_TX_FLOAT_RDFT, 1, FFT_SIZE, &invScale, 0);
        Check(ret, "inverse");
        m_inv.reset(raw);
    }

    float *Real() const { return m_real.get(); }

    AVComplexFloat *Spectrum() const { return m_spec.get(); }

    // Real() -> Spectrum()
    void Forward() const { m_fwdFn(m_fwd.get(), m_spec.get(), m_real.get(), sizeof(float)); }

    // Spectrum() -> Real(), Spectrum() is clobbered
    void Inverse() const { m_invFn(m_inv.get(), m_real.get(), m_spec.get(), sizeof(AVComplexFloat)); }

private:
    static void Check(const int ret, const char *direction) {
        if (ret < 0) {
            char txt[AV_ERROR_MAX_STRING_SIZE];
            av_strerror(ret, txt, sizeof(txt));
            throw std::runtime_error(fmt::format("Failed to set up {} FFT (ffmpeg: {})", direction, txt));
        }
    }

    AVTXContextPtr m_fwd;
    AVTXContextPtr m_inv;
    av_tx_fn m_fwdFn = nullptr;
    av_tx_fn m_invFn = nullptr;
    AlignedPtr<float> m_real;
    AlignedPtr<AVComplexFloat> m_spec;
};

// Triangular kernel of 2n+1 taps, normalized to unit sum.
std::vector<float> TriangleKernel(const int n) {
    std::vector<float> k(2 * n + 1);
    double sum = 0.0;
    for (int i = 0; i <= 2 * n; ++i) {
        k[i] = static_cast<float>(1.0 - std::abs(i - n) / static_cast<double>(n + 1));
        sum += k[i];
    }
    for (auto &v : k) {
        v = static_cast<float>(v / sum);
    }
    return k;
}

// Zero-padded "same" convolution in place.
void Convolve(float *data, const size_t len, const std::vector<float> &kernel, std::vector<float> &tmp) {
    const auto half = static_cast<ptrdiff_t>(kernel.size() / 2);
    tmp.assign(len, 0.0f);
    for (size_t i = 0; i < len; ++i) {
        float acc = 0.0f;
        for (size_t j = 0; j < kernel.size(); ++j) {
            const ptrdiff_t src = static_cast<ptrdiff_t>(i) + static_cast<ptrdiff_t>(j) - half;
            if (src >= 0 && src < static_cast<ptrdiff_t>(len)) {
                acc += kernel[j] * data[src];
            }
        }
        tmp[i] = acc;
    }
    std::copy(tmp.begin(), tmp.end(), data);
}

float ToDb(const AVComplexFloat &c) {
    const double mag = std::hypot(static_cast<double>(c.re), static_cast<double>(c.im));
    return static_cast<float>(20.0 * std::log10(std::max(mag, 1e-10)));
}

// Hann-windowed frames of one channel, centered by FFT_SIZE / 2 zeros on both sides.
class Stft {
public:
    static constexpr size_t PAD = FFT_SIZE / 2;

    Stft(const std::vector<float> &x, const Transform &tx)
        : m_x(x), m_tx(tx), m_frames((x.size() + 2 * PAD - FFT_SIZE + HOP_SIZE - 1) / HOP_SIZE + 1),
          m_window(FFT_SIZE) {
        for (int i = 0; i < FFT_SIZE; ++i) {
            m_window[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * i / FFT_SIZE));
        }
    }

    size_t Frames() const { return m_frames; }

    const AVComplexFloat *Analyze(const size_t t) const {
        float *real = m_tx.Real();
        const auto start = static_cast<ptrdiff_t>(t * HOP_SIZE) - static_cast<ptrdiff_t>(PAD);
        const auto n = static_cast<ptrdiff_t>(m_x.size());
        for (int i = 0; i < FFT_SIZE; ++i) {
            const ptrdiff_t idx = start + i;
            real[i] = idx >= 0 && idx < n ? m_x[idx] * m_window[i] : 0.0f;
        }
        m_tx.Forward();
        return m_tx.Spectrum();
    }

    // Windowed inverse of Spectrum() added onto y, which holds the unpadded signal.
    void Synthesize(const size_t t, std::vector<float> &y) const {
        m_tx.Inverse();
        const float *real = m_tx.Real();
        const auto start = static_cast<ptrdiff_t>(t * HOP_SIZE) - static_cast<ptrdiff_t>(PAD);
        const auto n = static_cast<ptrdiff_t>(y.size());
        for (int i = 0; i < FFT_SIZE; ++i) {
            const ptrdiff_t idx = start + i;
            if (idx >= 0 && idx < n) {
                y[idx] += real[i] * m_window[i];
            }
        }
    }

    // Sum of squared windows covering sample i, at most FFT_SIZE / HOP_SIZE terms.
    float WindowSum(const size_t i) const {
        const size_t p = i + PAD;
        const size_t last = std::min(m_frames - 1, p / HOP_SIZE);
        const size_t first = p + 1 > FFT_SIZE ? (p + 1 - FFT_SIZE + HOP_SIZE - 1) / HOP_SIZE : 0;
        float sum = 0.0f;
        for (size_t t = first; t <= last; ++t) {
            const float w = m_window[p - t * HOP_SIZE];
            sum += w * w;
        }
        return sum;
    }

private:
    const std::vector<float> &m_x;
    const Transform &m_tx;
    size_t m_frames;
    std::vector<float> m_window;
};

// Streams the STFT three times: peak level, per-bin noise statistics, then
// gating and resynthesis. Only the frames inside the time-smoothing window
// are held at once.
std::vector<float> ReduceChannel(const std::vector<float> &x, const int sampleRate, const double strength,
                                 const Transform &tx) {
    const Stft stft(x, tx);
    const size_t frames = stft.Frames();

    float peak = -std::numeric_limits<float>::infinity();
    for (size_t t = 0; t < frames; ++t) {
        const AVComplexFloat *s = stft.Analyze(t);
        for (int k = 0; k < BINS; ++k) {
            peak = std::max(peak, ToDb(s[k]));
        }
    }
    const float dbFloor = peak - static_cast<float>(TOP_DB);

    std::vector<double> sum(BINS, 0.0);
    std::vector<double> sumSq(BINS, 0.0);
    for (size_t t = 0; t < frames; ++t) {
        const AVComplexFloat *s = stft.Analyze(t);
        for (int k = 0; k < BINS; ++k) {
            const double db = std::max(ToDb(s[k]), dbFloor);
            sum[k] += db;
            sumSq[k] += db * db;
        }
    }
    std::vector<float> threshold(BINS);
    for (int k = 0; k < BINS; ++k) {
        const double mean = sum[k] / static_cast<double>(frames);
        const double var = std::max(0.0, sumSq[k] / static_cast<double>(frames) - mean * mean);
        threshold[k] = static_cast<float>(mean + THRESHOLD_STD * std::sqrt(var));
    }

    const int gradFreq = static_cast<int>(FREQ_SMOOTH_HZ / (sampleRate / (FFT_SIZE / 2.0)));
    const int gradTime = static_cast<int>(TIME_SMOOTH_MS / (HOP_SIZE * 1000.0 / sampleRate));
    const auto freqKernel = gradFreq > 0 ? TriangleKernel(gradFreq) : std::vector<float>{};
    const auto timeKernel = gradTime > 0 ? TriangleKernel(gradTime) : std::vector<float>{1.0f};
    const size_t lag = timeKernel.size() / 2;
    const size_t ring = timeKernel.size();

    // Ring slots hold frame t at (t % ring) * BINS.
    std::vector<AVComplexFloat> spectra(ring * BINS);
    std::vector<float> masks(ring * BINS);
    std::vector<float> tmp;
    std::vector<float> y(x.size(), 0.0f);

    for (size_t t = 0; t < frames + lag; ++t) {
        if (t < frames) {
            const size_t slot = (t % ring) * BINS;
            const AVComplexFloat *s = stft.Analyze(t);
            std::copy_n(s, BINS, spectra.begin() + static_cast<ptrdiff_t>(slot));
            for (int k = 0; k < BINS; ++k) {
                masks[slot + k] = std::max(ToDb(s[k]), dbFloor) > threshold[k] ? 1.0f : 0.0f;
            }
            if (!freqKernel.empty()) {
                Convolve(masks.data() + slot, BINS, freqKernel, tmp);
            }
        }
        if (t < lag) {
            continue;
        }

        // Frame e has every neighbour it needs once frame e + lag is in.
        const size_t e = t - lag;
        const size_t slot = (e % ring) * BINS;
        AVComplexFloat *out = tx.Spectrum();
        for (int k = 0; k < BINS; ++k) {
            float mask = 0.0f;
            for (size_t j = 0; j < ring; ++j) {
                const auto src = static_cast<ptrdiff_t>(e + j) - static_cast<ptrdiff_t>(lag);
                if (src >= 0 && src < static_cast<ptrdiff_t>(frames)) {
                    mask += timeKernel[j] * masks[(static_cast<size_t>(src) % ring) * BINS + k];
                }
            }
            const auto gain = static_cast<float>(mask * strength + (1.0 - strength));
            out[k].re = spectra[slot + k].re * gain;
            out[k].im = spectra[slot + k].im * gain;
        }
        stft.Synthesize(e, y);
    }

    for (size_t i = 0; i < y.size(); ++i) {
        const float w = stft.WindowSum(i);
        y[i] = w > 1e-8f ? y[i] / w : 0.0f;
    }
    return y;
}

} // namespace

Result Reduce(const Audio::PcmBuffer &pcm, const double strength) {
    if (!std::isfinite(strength) || strength < 0.0 || strength > 1.0) {
        return Failure{fmt::format("strength {} is outside [0, 1]", strength)};
    }
    if (pcm.SampleRate <= 0) {
        return Failure{"invalid sample rate"};
    }
    for (const auto &channel : pcm.Channels) {
        if (channel.size() != pcm.Frames()) {
            return Failure{"channels have different lengths"};
        }
        if (!std::all_of(channel.begin(), channel.end(), [](const float v) { return std::isfinite(v); })) {
            return Failure{"input contains non-finite samples"};
        }
    }

    if (strength == 0.0 || pcm.Frames() == 0) {
        return pcm;
    }

    try {
        const Transform tx;
        Audio::PcmBuffer out;
        out.SampleRate = pcm.SampleRate;
        out.Channels.reserve(pcm.Channels.size());
        for (const auto &channel : pcm.Channels) {
            out.Channels.push_back(ReduceChannel(channel, pcm.SampleRate, strength, tx));
        }
        return out;
    } catch (const std::exception &e) {
        return Failure{e.what()};
    }
}

} // namespace Denoise
