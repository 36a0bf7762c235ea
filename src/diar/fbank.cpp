#include "diar/fbank.hpp"
#include <algorithm>
#include <cmath>
#include <complex>

namespace diar {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Iterative radix-2 Cooley-Tukey; x.size() must be a power of two.
void fft_inplace(std::vector<std::complex<double>>& x) {
    const size_t n = x.size();
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }
    for (size_t len = 2; len <= n; len <<= 1) {
        const std::complex<double> wlen = std::polar(1.0, -2.0 * kPi / static_cast<double>(len));
        for (size_t i = 0; i < n; i += len) {
            std::complex<double> w = 1.0;
            for (size_t k = 0; k < len / 2; ++k) {
                const std::complex<double> u = x[i + k];
                const std::complex<double> v = x[i + k + len / 2] * w;
                x[i + k] = u + v;
                x[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

float hz_to_mel(float hz) { return 1127.0f * std::log(1.0f + hz / 700.0f); }
float mel_to_hz(float mel) { return 700.0f * (std::exp(mel / 1127.0f) - 1.0f); }

} // namespace

FbankExtractor::FbankExtractor(const Config& config) : m_config(config) {
    if (m_config.high_hz <= 0.0f) m_config.high_hz = m_config.sample_rate / 2.0f;

    m_window.resize(m_config.frame_length);
    for (int i = 0; i < m_config.frame_length; ++i) {
        m_window[i] = static_cast<float>(0.54 - 0.46 * std::cos(2.0 * kPi * i / (m_config.frame_length - 1)));
    }

    const int bins = m_config.n_fft / 2 + 1;
    const float bin_hz = static_cast<float>(m_config.sample_rate) / m_config.n_fft;
    const float mel_lo = hz_to_mel(m_config.low_hz);
    const float mel_hi = hz_to_mel(m_config.high_hz);
    const float mel_step = (mel_hi - mel_lo) / (m_config.n_mels + 1);

    m_filters.assign(static_cast<size_t>(m_config.n_mels) * bins, 0.0f);
    for (int m = 0; m < m_config.n_mels; ++m) {
        const float left = mel_lo + m * mel_step;
        const float centre = left + mel_step;
        const float right = centre + mel_step;
        for (int k = 0; k < bins; ++k) {
            const float mel = hz_to_mel(k * bin_hz);
            float w = 0.0f;
            if (mel > left && mel <= centre) w = (mel - left) / (centre - left);
            else if (mel > centre && mel < right) w = (right - mel) / (right - centre);
            m_filters[static_cast<size_t>(m) * bins + k] = w;
        }
    }
}

int FbankExtractor::num_frames(size_t n) const {
    if (n < static_cast<size_t>(m_config.frame_length)) return 0;
    return 1 + static_cast<int>((n - m_config.frame_length) / m_config.frame_shift);
}

std::vector<float> FbankExtractor::compute(const float* samples, size_t n) const {
    const int frames = num_frames(n);
    if (!samples || frames <= 0) return {};

    const int bins = m_config.n_fft / 2 + 1;
    const int mels = m_config.n_mels;
    std::vector<float> feats(static_cast<size_t>(frames) * mels);
    std::vector<float> frame(m_config.frame_length);
    std::vector<std::complex<double>> spec(m_config.n_fft);

    for (int f = 0; f < frames; ++f) {
        const float* src = samples + static_cast<size_t>(f) * m_config.frame_shift;

        // DC removal, pre-emphasis, window
        double mean = 0.0;
        for (int i = 0; i < m_config.frame_length; ++i) mean += src[i];
        mean /= m_config.frame_length;
        for (int i = 0; i < m_config.frame_length; ++i) frame[i] = static_cast<float>(src[i] - mean);
        for (int i = m_config.frame_length - 1; i > 0; --i) frame[i] -= m_config.preemph * frame[i - 1];
        frame[0] -= m_config.preemph * frame[0];

        std::fill(spec.begin(), spec.end(), std::complex<double>(0.0, 0.0));
        for (int i = 0; i < m_config.frame_length; ++i) spec[i] = frame[i] * m_window[i];
        fft_inplace(spec);

        for (int m = 0; m < mels; ++m) {
            const float* w = &m_filters[static_cast<size_t>(m) * bins];
            double e = 0.0;
            for (int k = 0; k < bins; ++k) {
                if (w[k] != 0.0f) e += w[k] * std::norm(spec[k]);
            }
            feats[static_cast<size_t>(f) * mels + m] = static_cast<float>(std::log(std::max(e, 1e-10)));
        }
    }

    if (m_config.mean_normalize) {
        for (int m = 0; m < mels; ++m) {
            double acc = 0.0;
            for (int f = 0; f < frames; ++f) acc += feats[static_cast<size_t>(f) * mels + m];
            const float mean = static_cast<float>(acc / frames);
            for (int f = 0; f < frames; ++f) feats[static_cast<size_t>(f) * mels + m] -= mean;
        }
    }
    return feats;
}

} // namespace diar
