#include "core/config.hpp"
#include <cstdlib>
#include <string>

namespace core {

namespace {
const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void env_string(const char* name, std::string& out) {
    if (const char* v = env(name)) out = v;
}

void env_int(const char* name, int& out) {
    if (const char* v = env(name)) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (end && *end == '\0') out = static_cast<int>(n);
    }
}

void env_double(const char* name, double& out) {
    if (const char* v = env(name)) {
        char* end = nullptr;
        double d = std::strtod(v, &end);
        if (end && *end == '\0') out = d;
    }
}

void env_float(const char* name, float& out) {
    double d = out;
    env_double(name, d);
    out = static_cast<float>(d);
}

void env_bool(const char* name, bool& out) {
    if (const char* v = env(name)) {
        std::string s(v);
        out = (s == "1" || s == "true" || s == "yes" || s == "on");
    }
}
} // namespace

Config load_config_from_env() {
    Config c;
    env_string("DUBLINE_LOG_LEVEL", c.log_level);
    env_string("DUBLINE_WORK_DIR", c.work_root);
    env_string("DUBLINE_OUTPUT_DIR", c.output_dir);
    env_int("DUBLINE_SAMPLE_RATE", c.sample_rate);
    env_double("DUBLINE_SILENCE_GAP", c.silence_gap_s);
    env_double("DUBLINE_DURATION_TOLERANCE", c.duration_tolerance_s);
    env_double("DUBLINE_MAX_STRETCH", c.max_stretch_factor);
    int chunk = static_cast<int>(c.max_chunk_chars);
    env_int("DUBLINE_MAX_CHUNK_CHARS", chunk);
    if (chunk > 0) c.max_chunk_chars = static_cast<size_t>(chunk);
    env_float("DUBLINE_VOICE_GAIN", c.voice_gain);
    env_float("DUBLINE_BACKGROUND_GAIN", c.background_gain);
    env_bool("DUBLINE_DUCKING", c.ducking);
    env_float("DUBLINE_DUCKING_THRESHOLD", c.ducking_threshold);
    env_float("DUBLINE_DUCKING_RATIO", c.ducking_ratio);
    env_int("DUBLINE_MAX_WORKERS", c.max_workers);
    env_int("DUBLINE_PROBE_TIMEOUT_MS", c.probe_timeout_ms);
    env_int("DUBLINE_EXTRACT_TIMEOUT_MS", c.extract_timeout_ms);
    env_int("DUBLINE_TOOL_TIMEOUT_MS", c.tool_timeout_ms);
    env_int("DUBLINE_HTTP_TIMEOUT_MS", c.http_timeout_ms);
    env_bool("DUBLINE_CAPTIONS", c.captions);
    env_bool("DUBLINE_ARCHIVE", c.archive);
    env_string("DUBLINE_EXPORT_FORMAT", c.export_format);
    env_string("DUBLINE_WHISPER_MODEL", c.whisper_model);
    env_string("DUBLINE_SPEAKER_MODEL", c.speaker_model);
    env_int("DUBLINE_MAX_SPEAKERS", c.max_speakers);
    env_string("DUBLINE_TRANSLATION_URL", c.translation_url);
    env_string("DUBLINE_TRANSLATION_MODEL", c.translation_model);
    env_string("OPENAI_API_KEY", c.openai_api_key);
    env_string("DUBLINE_SYNTHESIS_URL", c.synthesis_url);
    env_string("DEEPGRAM_API_KEY", c.deepgram_api_key);
    env_string("DUBLINE_VOICE_CATALOG", c.voice_catalog_path);
    return c;
}

std::vector<std::string> Config::validate(bool need_providers) const {
    std::vector<std::string> problems;
    if (sample_rate <= 0) problems.push_back("sample rate must be positive");
    if (channels != 1) problems.push_back("only mono working format is supported");
    if (silence_gap_s < 0.0) problems.push_back("silence gap threshold must not be negative");
    if (duration_tolerance_s <= 0.0) problems.push_back("duration tolerance must be positive");
    if (max_stretch_factor < 1.0) problems.push_back("max stretch factor must be >= 1.0");
    if (max_chunk_chars == 0) problems.push_back("max chunk length must be positive");
    if (max_workers <= 0) problems.push_back("max workers must be positive");
    if (probe_timeout_ms <= 0 || extract_timeout_ms <= 0 || tool_timeout_ms <= 0 || http_timeout_ms <= 0) {
        problems.push_back("timeouts must be positive");
    }
    if (peak_headroom <= 0.0f || peak_headroom > 1.0f) problems.push_back("peak headroom must be in (0, 1]");
    if (export_format != "wav" && export_format != "m4a") problems.push_back("export format must be wav or m4a");
    if (need_providers) {
        if (openai_api_key.empty()) problems.push_back("OPENAI_API_KEY is not set");
        if (deepgram_api_key.empty()) problems.push_back("DEEPGRAM_API_KEY is not set");
    }
    return problems;
}

}
