#include "SpectralFlux.h"
#include "tracing/Tracing.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>

namespace ReelSync {

namespace {

constexpr double kPi = 3.14159265358979323846;

size_t fftSizeFor(int windowSize) {
    size_t n = 1;
    while (n < static_cast<size_t>(windowSize)) n *= 2;
    return n;
}

// Iterative radix-2 transform; data.size() must be a power of two
void transformInPlace(std::vector<std::complex<double>>& data) {
    const size_t n = data.size();
    for (size_t i = 1, rev = 0; i < n; ++i) {
        size_t mask = n / 2;
        while (rev & mask) {
            rev ^= mask;
            mask /= 2;
        }
        rev |= mask;
        if (i < rev) std::swap(data[i], data[rev]);
    }

    for (size_t span = 2; span <= n; span *= 2) {
        const std::complex<double> step = std::polar(1.0, -2.0 * kPi / static_cast<double>(span));
        const size_t halfSpan = span / 2;
        for (size_t base = 0; base < n; base += span) {
            std::complex<double> twiddle(1.0, 0.0);
            for (size_t k = 0; k < halfSpan; ++k) {
                const std::complex<double> even = data[base + k];
                const std::complex<double> odd = data[base + k + halfSpan] * twiddle;
                data[base + k] = even + odd;
                data[base + k + halfSpan] = even - odd;
                twiddle *= step;
            }
        }
    }
}

std::vector<double> makeHann(int size) {
    std::vector<double> w(static_cast<size_t>(std::max(size, 0)), 1.0);
    if (size > 1) {
        const double denom = static_cast<double>(size - 1);
        for (size_t i = 0; i < w.size(); ++i) {
            w[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / denom);
        }
    }
    return w;
}

// Gaussian blur with edge samples repeated past both ends
std::vector<double> blur(const std::vector<double>& signal, double sigma) {
    if (sigma <= 0.0 || signal.empty()) return signal;

    const int radius = std::max(1, static_cast<int>(std::ceil(3.0 * sigma)));
    std::vector<double> taps;
    for (int k = -radius; k <= radius; ++k) {
        taps.push_back(std::exp(-0.5 * k * k / (sigma * sigma)));
    }
    const double norm = std::accumulate(taps.begin(), taps.end(), 0.0);

    const int last = static_cast<int>(signal.size()) - 1;
    std::vector<double> out(signal.size(), 0.0);
    for (int i = 0; i <= last; ++i) {
        double acc = 0.0;
        for (int k = -radius; k <= radius; ++k) {
            acc += signal[std::clamp(i + k, 0, last)] * taps[k + radius];
        }
        out[i] = acc / norm;
    }
    return out;
}

} // namespace

double OnsetEnvelope::frameTime(std::size_t frame) const {
    if (sampleRate <= 0) return 0.0;
    // Report the centre of the analysis window
    return (double(frame) * hopSize + windowSize / 2.0) / double(sampleRate);
}

OnsetEnvelope computeOnsetEnvelope(const std::vector<float>& samples, int sampleRate,
                                   const OnsetParams& params) {
    TRACE_FUNC();
    OnsetEnvelope env;
    env.hopSize = params.hopSize;
    env.windowSize = params.windowSize;
    env.sampleRate = sampleRate;
    if (samples.empty() || sampleRate <= 0 || params.windowSize <= 0 || params.hopSize <= 0) return env;

    const int N = params.windowSize;
    const int H = params.hopSize;
    const int numFrames = 1 + (std::max(0, (int)samples.size() - N) / H);

    const std::vector<double> window = makeHann(N);
    std::vector<std::complex<double>> buf(fftSizeFor(N));
    const int half = N / 2;
    std::vector<double> prevMag(half + 1, 0.0);
    std::vector<double> mag(half + 1, 0.0);
    std::vector<double> flux(numFrames, 0.0);
    env.raw.assign(numFrames, 0.0);

    for (int f = 0; f < numFrames; ++f) {
        const int offset = f * H;
        std::fill(buf.begin(), buf.end(), std::complex<double>(0.0, 0.0));
        for (int i = 0; i < N; ++i) {
            double v = 0.0;
            if (offset + i < (int)samples.size()) v = samples[offset + i];
            buf[i] = std::complex<double>(v * window[i], 0.0);
        }

        transformInPlace(buf);
        double magSum = 0.0;
        for (int k = 0; k <= half; ++k) {
            mag[k] = std::abs(buf[k]);
            magSum += mag[k];
        }

        // Spectral flux (only positive increases); frame 0 has no predecessor
        double sumPos = 0.0;
        if (f > 0) {
            for (int k = 0; k <= half; ++k) {
                double diff = mag[k] - prevMag[k];
                if (diff > 0) sumPos += diff;
            }
        }
        flux[f] = sumPos;
        env.raw[f] = sumPos / (magSum + 1e-9);
        prevMag.swap(mag);
    }

    // z-score so the threshold factor is independent of loudness
    const double mean = std::accumulate(flux.begin(), flux.end(), 0.0) / static_cast<double>(flux.size());
    double variance = 0.0;
    for (double v : flux) variance += (v - mean) * (v - mean);
    const double stdev = flux.size() > 1 ? std::sqrt(variance / static_cast<double>(flux.size() - 1)) : 0.0;
    for (double& v : flux) v = (v - mean) / (stdev + 1e-9);

    env.envelope = blur(flux, params.smoothSigma);
    return env;
}

std::vector<double> pickOnsets(const OnsetEnvelope& env, const OnsetParams& params) {
    std::vector<double> onsets;
    const auto& smooth = env.envelope;
    if (smooth.size() < 3) return onsets;

    const int w = std::max(1, params.thresholdWindow);
    double lastT = -1e9;
    for (size_t i = 1; i + 1 < smooth.size(); ++i) {
        if (!(smooth[i] > smooth[i-1] && smooth[i] >= smooth[i+1])) continue;
        if (smooth[i] <= 0.0) continue;

        int start = std::max<int>(0, int(i) - w);
        int end = std::min<int>(int(smooth.size()) - 1, int(i) + w);
        double localMean = 0.0;
        for (int j = start; j <= end; ++j) localMean += smooth[j];
        localMean /= (end - start + 1);
        if (!(smooth[i] > localMean * params.thresholdFactor)) continue;

        // The smoothed peak may sit a frame or two off the raw spike
        double strength = 0.0;
        int rs = std::max<int>(0, int(i) - 2);
        int re = std::min<int>(int(env.raw.size()) - 1, int(i) + 2);
        for (int j = rs; j <= re; ++j) strength = std::max(strength, env.raw[j]);
        if (strength < params.minStrength) continue;

        double t = env.frameTime(i);
        if (t - lastT >= params.minSpacing) {
            onsets.push_back(t);
            lastT = t;
        }
    }
    return onsets;
}

std::vector<double> detectBeatsFromWaveform(const std::vector<float>& samples, int sampleRate,
                                            const OnsetParams& params) {
    TRACE_FUNC();
    OnsetEnvelope env = computeOnsetEnvelope(samples, sampleRate, params);
    return pickOnsets(env, params);
}

} // namespace ReelSync
