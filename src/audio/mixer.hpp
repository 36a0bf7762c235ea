#pragma once
#include <string>
#include <vector>
#include "audio/audio_tool_runner.hpp"
#include "audio/pcm_buffer.hpp"

namespace audio {

struct MixSettings {
    int sample_rate = 44100;
    float voice_gain = 0.8f;
    float background_gain = 0.3f;
    bool ducking = false;
    float ducking_threshold = 0.1f; // voice RMS above this ducks the background
    float ducking_ratio = 0.3f;     // background gain multiplier while ducked
    double ducking_window_s = 0.1;
    float headroom = 0.95f;         // peak after safety scaling
};

// Per-sample background gain multiplier (1.0 or ducking_ratio) derived from a
// windowed RMS envelope of `voice`, linearly interpolated between window centres.
std::vector<float> ducking_mask(const PcmBuffer& voice, const MixSettings& s);

// In-memory mix of two mono buffers at the same rate. The result has the
// voice's length; the background is looped or cut to fit. A null background
// yields the gain-adjusted voice. The result's peak never exceeds 1.0.
PcmBuffer mix_buffers(const PcmBuffer& voice, const PcmBuffer* background, const MixSettings& s);

class Mixer {
public:
    Mixer(AudioToolRunner& runner, MixSettings settings) : runner_(runner), settings_(settings) {}

    // Empty `background_path` means voice only. Throws core::MixingError.
    std::string mix(const std::string& voice_path, const std::string& background_path,
                    const std::string& out_wav);

    const MixSettings& settings() const { return settings_; }

private:
    PcmBuffer load_canonical(const std::string& path, const std::string& scratch, const char* what);

    AudioToolRunner& runner_;
    MixSettings settings_;
};

}
