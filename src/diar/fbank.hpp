#pragma once

#include <cstddef>
#include <vector>

namespace diar {

/**
 * Log mel filterbank (Fbank) features for the speaker embedding model.
 *
 * 25 ms Hamming frames with 10 ms hop, pre-emphasis 0.97, 512-point FFT,
 * natural-log mel energies. Per-utterance mean normalization is applied
 * across frames, which is what WeSpeaker-style models are trained on.
 */
class FbankExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int frame_length = 400;   // 25 ms at 16 kHz
        int frame_shift = 160;    // 10 ms at 16 kHz
        int n_fft = 512;          // power of two >= frame_length
        int n_mels = 80;
        float low_hz = 20.0f;
        float high_hz = 0.0f;     // <= 0 means Nyquist
        float preemph = 0.97f;
        bool mean_normalize = true;
    };

    FbankExtractor() : FbankExtractor(Config{}) {}
    explicit FbankExtractor(const Config& config);

    /**
     * @param samples mono float audio in [-1, 1] at config().sample_rate
     * @return row-major [num_frames(n) x n_mels]; empty when the input is shorter than one frame
     */
    std::vector<float> compute(const float* samples, size_t n) const;

    int num_frames(size_t n) const;
    int n_mels() const { return m_config.n_mels; }
    const Config& config() const { return m_config; }

private:
    Config m_config;
    std::vector<float> m_window;
    std::vector<float> m_filters;  // [n_mels x (n_fft/2 + 1)]
};

} // namespace diar
