#pragma once
#include <cstddef>
#include <vector>

namespace audio {

// Interleaved float PCM in [-1, 1].
struct PcmBuffer {
    std::vector<float> samples;
    int sample_rate = 0;
    int channels = 1;

    size_t frames() const { return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0; }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
    bool empty() const { return samples.empty(); }
};

// Number of frames covering `seconds` at `sample_rate` (rounded to nearest).
size_t frames_for(double seconds, int sample_rate);

PcmBuffer make_silence(double seconds, int sample_rate, int channels = 1);

// Appends silence or drops trailing frames so the buffer holds exactly `frames` frames.
void fit_to_frames(PcmBuffer& buf, size_t frames);

// Copies the [start_s, end_s) range (clamped to the buffer).
PcmBuffer slice(const PcmBuffer& buf, double start_s, double end_s);

// Appends `tail`; both buffers must share sample rate and channel count.
bool append(PcmBuffer& dst, const PcmBuffer& tail);

float peak_abs(const PcmBuffer& buf);
void apply_gain(PcmBuffer& buf, float gain);

// Averages all channels into one.
PcmBuffer downmix_to_mono(const PcmBuffer& buf);

}
