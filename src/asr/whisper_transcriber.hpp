#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "asr/transcriber.hpp"
#include "audio/audio_tool_runner.hpp"

struct whisper_context;

namespace diar { class SpeakerEmbedder; }

namespace asr {

// Resolves a model name ("small", "base.en", or a path) against models/.
std::string resolve_whisper_model(const std::string& model_name);

// Drops whitespace and non-speech markers such as "[BLANK_AUDIO]". Returns an
// empty string for segments that carry no speech.
std::string clean_segment_text(const std::string& raw);

// whisper.cpp transcription with ONNX speaker embeddings for diarization.
class WhisperTranscriber : public Transcriber {
public:
    struct Options {
        std::string model = "small";
        std::string speaker_model = "models/speaker_embedding.onnx";
        int max_speakers = 2;
        int threads = 0;       // 0 = hardware concurrency
        std::string work_dir;  // scratch for the 16 kHz copy; empty = next to input
    };

    WhisperTranscriber(audio::AudioToolRunner& runner, Options opts);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    // Loads the model; transcribe() calls it lazily too.
    bool load();

    core::Expected<TranscriptionResult, core::Error> transcribe(
        const std::string& audio_path, const std::string& language, bool diarize) override;

private:
    void diarize(const std::vector<float>& pcm16k, std::vector<Utterance>& utts);

    audio::AudioToolRunner& runner_;
    Options opts_;
    whisper_context* ctx_ = nullptr;
    std::unique_ptr<diar::SpeakerEmbedder> embedder_;
    bool embedder_failed_ = false;
    std::mutex mu_;  // a whisper context runs one decode at a time
};

}
