#pragma once
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/expected.hpp"

namespace asr {

// One diarized stretch of speech. Produced once per job; ordered by start.
struct Utterance {
    double start = 0.0;   // seconds
    double end = 0.0;
    std::string text;
    int speaker_id = 0;
    float confidence = 0.0f;  // [0, 1]
};

struct TranscriptionResult {
    std::string transcript;
    float confidence = 0.0f;
    double duration_seconds = 0.0;
    std::vector<Utterance> utterances;
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Errors carry ErrorCode::Transcription.
    virtual core::Expected<TranscriptionResult, core::Error> transcribe(
        const std::string& audio_path, const std::string& language, bool diarize) = 0;
};

}
