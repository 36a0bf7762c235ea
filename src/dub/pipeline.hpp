#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "asr/transcriber.hpp"
#include "audio/audio_tool_runner.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "diar/voice_catalog.hpp"
#include "dub/exporter.hpp"
#include "dub/synthesizer.hpp"
#include "dub/translator.hpp"

namespace dub {

struct PipelineRequest {
    std::string job_id;
    std::string voice_path;
    std::string background_path;               // empty = none
    std::string source_language;
    std::vector<std::string> target_languages;
};

struct PipelineResult {
    std::string language_code;
    std::string final_audio_path;
    std::string transcript_text;
    std::string translated_text;
};

struct LanguageOutcome {
    bool ok = false;
    PipelineResult result;
    ExportedFiles files;
    core::Error error;                  // set when !ok
    size_t segments = 0;
    size_t substituted_segments = 0;    // speech replaced by silence
    bool mixed_with_background = false;
};

// percent in [0, 100]; calls are serialized.
using ProgressCallback = std::function<void(int percent, const std::string& message)>;

// Probe -> transcribe -> segment -> per language {voices, translate, synthesize,
// fit, reconstruct, mix, export}. Languages run concurrently up to
// config.max_workers; each owns its own scratch directory.
class DubbingPipeline {
public:
    DubbingPipeline(asr::Transcriber& transcriber, Translator& translator, Synthesizer& synthesizer,
                    audio::AudioToolRunner& runner, const diar::VoiceCatalog& catalog, const core::Config& config);

    // Never throws for per-language failures; each language reports its own outcome.
    std::map<std::string, LanguageOutcome> run(const PipelineRequest& request, const ProgressCallback& progress = {});

private:
    asr::Transcriber& transcriber_;
    Translator& translator_;
    Synthesizer& synthesizer_;
    audio::AudioToolRunner& runner_;
    const diar::VoiceCatalog& catalog_;
    const core::Config& config_;
};

}
