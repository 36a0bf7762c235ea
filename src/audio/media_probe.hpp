#pragma once
#include <string>
#include "audio/audio_tool_runner.hpp"

namespace audio {

// Input validation and metadata over an AudioToolRunner. Failures throw the
// core::PipelineError subclasses named after the failure (MediaNotFoundError, ...).
class MediaProbe {
public:
    explicit MediaProbe(AudioToolRunner& runner) : runner_(runner) {}

    // Requires an audio stream; throws UnsupportedFormatError otherwise.
    MediaInfo probe(const std::string& path);

    // Writes exactly one new file at out_path; never touches the input.
    std::string extract_audio_track(const std::string& video_path, const std::string& out_path,
                                    ExtractFormat format = ExtractFormat::Wav);

    // Probe + (extract if video) + decode to canonical PCM16 WAV.
    // Returns the canonical WAV path and fills `info` with the source metadata.
    std::string prepare_canonical(const std::string& input_path, const std::string& work_dir,
                                  const std::string& stem, int sample_rate, MediaInfo& info);

private:
    AudioToolRunner& runner_;
};

}
