#pragma once
#include <string>
#include <vector>
#include "audio/audio_tool_runner.hpp"
#include "dub/synthesizer.hpp"
#include "dub/translator.hpp"

namespace dub {

// Translates `chunks` strictly in order. The first failing chunk fails the call.
core::Expected<std::vector<std::string>, core::Error> translate_chunked(
    Translator& translator, const std::vector<std::string>& chunks,
    const std::string& target_language, const std::string& source_language);

struct SynthesisTarget {
    std::string work_dir;
    std::string stem;        // file name prefix inside work_dir
    int sample_rate = 44100;
};

// Synthesizes each chunk in order, decodes it to canonical mono PCM and
// concatenates sample-accurately into `<work_dir>/<stem>.speech.wav`.
core::Expected<std::string, core::Error> synthesize_chunked(
    Synthesizer& synthesizer, audio::AudioToolRunner& runner, const std::vector<std::string>& chunks,
    const std::string& target_language, const std::string& voice_id, const SynthesisTarget& target);

}
