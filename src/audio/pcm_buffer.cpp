#include "audio/pcm_buffer.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

size_t frames_for(double seconds, int sample_rate) {
    if (seconds <= 0.0 || sample_rate <= 0) return 0;
    return static_cast<size_t>(std::llround(seconds * sample_rate));
}

PcmBuffer make_silence(double seconds, int sample_rate, int channels) {
    PcmBuffer out;
    out.sample_rate = sample_rate;
    out.channels = std::max(1, channels);
    out.samples.assign(frames_for(seconds, sample_rate) * out.channels, 0.0f);
    return out;
}

void fit_to_frames(PcmBuffer& buf, size_t frames) {
    buf.samples.resize(frames * static_cast<size_t>(std::max(1, buf.channels)), 0.0f);
}

PcmBuffer slice(const PcmBuffer& buf, double start_s, double end_s) {
    PcmBuffer out;
    out.sample_rate = buf.sample_rate;
    out.channels = buf.channels;
    const size_t total = buf.frames();
    size_t f0 = std::min(frames_for(start_s, buf.sample_rate), total);
    size_t f1 = std::min(frames_for(end_s, buf.sample_rate), total);
    if (f1 <= f0) return out;
    const size_t ch = static_cast<size_t>(buf.channels);
    out.samples.assign(buf.samples.begin() + f0 * ch, buf.samples.begin() + f1 * ch);
    return out;
}

bool append(PcmBuffer& dst, const PcmBuffer& tail) {
    if (dst.samples.empty() && dst.sample_rate == 0) {
        dst = tail;
        return true;
    }
    if (dst.sample_rate != tail.sample_rate || dst.channels != tail.channels) return false;
    dst.samples.insert(dst.samples.end(), tail.samples.begin(), tail.samples.end());
    return true;
}

float peak_abs(const PcmBuffer& buf) {
    float peak = 0.0f;
    for (float s : buf.samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

void apply_gain(PcmBuffer& buf, float gain) {
    for (float& s : buf.samples) s *= gain;
}

PcmBuffer downmix_to_mono(const PcmBuffer& buf) {
    if (buf.channels <= 1) return buf;
    PcmBuffer out;
    out.sample_rate = buf.sample_rate;
    out.channels = 1;
    const size_t n = buf.frames();
    out.samples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < buf.channels; ++c) sum += buf.samples[i * buf.channels + c];
        out.samples[i] = sum / static_cast<float>(buf.channels);
    }
    return out;
}

}
