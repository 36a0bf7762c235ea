#include "diar/pitch_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace diar {

namespace {

// Box-filter decimation to at most ~22 kHz; autocorrelation cost grows with rate squared.
std::vector<float> decimate(const float* samples, size_t n, int sample_rate, int& out_rate) {
    const int factor = std::max(1, sample_rate / 22050);
    out_rate = sample_rate / factor;
    std::vector<float> out(n / factor);
    for (size_t i = 0; i < out.size(); ++i) {
        float acc = 0.0f;
        for (int k = 0; k < factor; ++k) acc += samples[i * factor + k];
        out[i] = acc / factor;
    }
    return out;
}

// Frequency of one frame, or 0 if unvoiced.
float frame_pitch(const float* x, size_t len, int rate, int min_lag, int max_lag, float voiced_corr) {
    std::vector<double> corr(max_lag + 1, 0.0);
    double best = 0.0;
    for (int lag = min_lag; lag <= max_lag; ++lag) {
        double num = 0.0, e0 = 0.0, e1 = 0.0;
        for (size_t i = 0; i + lag < len; ++i) {
            num += static_cast<double>(x[i]) * x[i + lag];
            e0 += static_cast<double>(x[i]) * x[i];
            e1 += static_cast<double>(x[i + lag]) * x[i + lag];
        }
        corr[lag] = (e0 > 0.0 && e1 > 0.0) ? num / std::sqrt(e0 * e1) : 0.0;
        best = std::max(best, corr[lag]);
    }
    if (best <= voiced_corr) return 0.0f;

    // First local peak close to the global maximum; avoids picking a sub-harmonic.
    for (int lag = min_lag + 1; lag < max_lag; ++lag) {
        if (corr[lag] >= 0.9 * best && corr[lag] >= corr[lag - 1] && corr[lag] >= corr[lag + 1]) {
            const double a = corr[lag - 1], b = corr[lag], c = corr[lag + 1];
            const double denom = a - 2.0 * b + c;
            const double shift = std::fabs(denom) > 1e-12 ? 0.5 * (a - c) / denom : 0.0;
            return static_cast<float>(rate / (lag + shift));
        }
    }
    return 0.0f;
}

} // namespace

float estimate_pitch(const float* samples, size_t n, int sample_rate, const PitchSettings& s) {
    if (!samples || n == 0 || sample_rate <= 0) return 0.0f;

    int rate = sample_rate;
    std::vector<float> x = decimate(samples, n, sample_rate, rate);

    const size_t frame = static_cast<size_t>(s.frame_s * rate);
    const size_t hop = std::max<size_t>(1, static_cast<size_t>(s.hop_s * rate));
    const int min_lag = std::max(2, static_cast<int>(rate / s.max_hz));
    const int max_lag = static_cast<int>(rate / s.min_hz);
    if (frame <= static_cast<size_t>(max_lag) || x.size() < frame) return 0.0f;

    double sum = 0.0;
    int voiced = 0;
    for (size_t pos = 0; pos + frame <= x.size(); pos += hop) {
        const float* f = x.data() + pos;
        double energy = 0.0;
        for (size_t i = 0; i < frame; ++i) energy += static_cast<double>(f[i]) * f[i];
        if (std::sqrt(energy / frame) < s.rms_floor) continue;

        const float hz = frame_pitch(f, frame, rate, min_lag, max_lag, s.voiced_corr);
        if (hz > 0.0f) {
            sum += hz;
            ++voiced;
        }
    }
    return voiced > 0 ? static_cast<float>(sum / voiced) : 0.0f;
}

}
