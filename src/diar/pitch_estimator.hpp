#pragma once
#include <cstddef>

namespace diar {

struct PitchSettings {
    double frame_s = 0.040;
    double hop_s = 0.010;
    float min_hz = 65.0f;
    float max_hz = 1050.0f;
    float rms_floor = 0.01f;     // frames quieter than this are treated as silence
    float voiced_corr = 0.3f;    // normalized autocorrelation needed to call a frame voiced
};

// Average fundamental frequency (Hz) over voiced frames of a mono sample.
// Returns 0.0 when no frame is voiced.
float estimate_pitch(const float* samples, size_t n, int sample_rate, const PitchSettings& s = PitchSettings{});

}
