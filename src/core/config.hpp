#pragma once
#include <string>
#include <vector>

namespace core {

struct Config {
    // Logging / locations
    std::string log_level = "info";
    std::string work_root;              // empty = system temp directory
    std::string output_dir = "output";

    // Canonical working format
    int sample_rate = 44100;
    int channels = 1;

    // Timeline
    double silence_gap_s = 0.1;
    double min_speech_s = 0.05;
    double speaker_sample_min_s = 0.5;

    // Duration matching
    double duration_tolerance_s = 0.05;
    double max_stretch_factor = 1.35;

    // Chunking
    size_t max_chunk_chars = 1000;

    // Mixing
    float voice_gain = 0.8f;
    float background_gain = 0.3f;
    bool ducking = false;
    float ducking_threshold = 0.1f;
    float ducking_ratio = 0.3f;
    double ducking_window_s = 0.1;
    float peak_headroom = 0.95f;

    // Concurrency / timeouts
    int max_workers = 2;
    int probe_timeout_ms = 30000;
    int extract_timeout_ms = 300000;
    int tool_timeout_ms = 120000;
    int http_timeout_ms = 60000;

    // Export
    bool captions = false;
    bool archive = false;
    std::string export_format = "wav"; // wav | m4a

    // Providers
    std::string whisper_model = "small";
    std::string speaker_model = "models/speaker_embedding.onnx";
    int max_speakers = 2;
    std::string translation_url = "https://api.openai.com/v1/chat/completions";
    std::string translation_model = "gpt-4o-mini";
    std::string openai_api_key;
    std::string synthesis_url = "https://api.deepgram.com/v1/speak";
    std::string deepgram_api_key;
    std::string voice_catalog_path;

    // Returns a list of human-readable problems; empty when usable.
    std::vector<std::string> validate(bool need_providers) const;
};

// Builds a Config from defaults overridden by DUBLINE_* / provider env vars.
Config load_config_from_env();
}
