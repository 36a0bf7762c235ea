#pragma once
#include <string>
#include "audio/audio_tool_runner.hpp"
#include "core/errors.hpp"
#include "core/expected.hpp"

namespace audio {

enum class MatchAction {
    Silence,      // target too short, input discarded
    PassThrough,  // already within tolerance
    Padded,       // trailing silence appended
    Stretched,    // tempo change, then cut to length
    Trimmed       // too long to stretch, content cut
};

const char* match_action_name(MatchAction a);

struct MatchResult {
    std::string path;
    double input_duration = 0.0;
    double output_duration = 0.0;
    double speed_factor = 1.0;
    MatchAction action = MatchAction::PassThrough;
};

struct DurationMatcherConfig {
    int sample_rate = 44100;
    double tolerance_s = 0.05;
    double min_target_s = 0.05;
    double max_stretch = 1.35;
};

// Fits synthesized speech into a timeline slot. Output is always canonical PCM16 mono WAV.
class DurationMatcher {
public:
    DurationMatcher(AudioToolRunner& runner, DurationMatcherConfig cfg) : runner_(runner), cfg_(cfg) {}

    core::Expected<MatchResult, core::Error> match_duration(const std::string& input_path,
                                                            double target_duration,
                                                            const std::string& out_wav);

    // Pure silence of exactly `duration` seconds (rounded to whole frames).
    core::Expected<MatchResult, core::Error> silence_clip(double duration, const std::string& out_wav);

    const DurationMatcherConfig& config() const { return cfg_; }

private:
    AudioToolRunner& runner_;
    DurationMatcherConfig cfg_;
};

}
