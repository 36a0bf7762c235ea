#include "asr/whisper_transcriber.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/wav_io.hpp"
#include "core/logging.hpp"
#include "diar/speaker_clusterer.hpp"
#include "diar/speaker_embedder.hpp"
#include <whisper.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace asr {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

namespace {

constexpr int kWhisperRate = 16000;

// Keep errors/warnings from whisper/ggml; info only at debug level.
void log_cb(ggml_log_level level, const char* text, void*) {
    if (!text) return;
    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (line.empty()) return;
    switch (level) {
    case GGML_LOG_LEVEL_ERROR: core::log_error("[whisper] " + line); break;
    case GGML_LOG_LEVEL_WARN:  core::log_warn("[whisper] " + line); break;
    default:                   core::log_debug("[whisper] " + line); break;
    }
}

} // namespace

std::string resolve_whisper_model(const std::string& model_name) {
    auto exists = [](const std::string& p) { return std::filesystem::exists(std::filesystem::u8path(p)); };
    if (model_name.find(".gguf") != std::string::npos || model_name.find(".bin") != std::string::npos) {
        return model_name;
    }
    const std::string candidates[] = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return candidates[4];
}

std::string clean_segment_text(const std::string& raw) {
    const size_t a = raw.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    const size_t b = raw.find_last_not_of(" \t\r\n");
    std::string s = raw.substr(a, b - a + 1);
    if (s.size() >= 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'))) {
        return {};
    }
    return s;
}

WhisperTranscriber::WhisperTranscriber(audio::AudioToolRunner& runner, Options opts)
    : runner_(runner), opts_(std::move(opts)) {}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) whisper_free(ctx_);
}

bool WhisperTranscriber::load() {
    if (ctx_) return true;
    const std::string path = resolve_whisper_model(opts_.model);
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    core::log_info("[whisper] init from: " + path);
    ctx_ = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx_) {
        core::log_error("[whisper] init FAILED for path: " + path);
        return false;
    }
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    return true;
}

core::Expected<TranscriptionResult, core::Error> WhisperTranscriber::transcribe(
    const std::string& audio_path, const std::string& language, bool diarize_speakers) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!load()) {
        return make_unexpected(make_error(ErrorCode::Transcription, "transcription", "speech model could not be loaded"));
    }

    namespace fs = std::filesystem;
    const fs::path dir = opts_.work_dir.empty() ? fs::path(audio_path).parent_path() : fs::path(opts_.work_dir);
    const std::string wav16 = (dir / (fs::path(audio_path).stem().string() + ".16k.wav")).string();
    auto norm = runner_.normalize(audio_path, wav16, kWhisperRate, 1);
    if (!norm) {
        return make_unexpected(make_error(ErrorCode::Transcription, "transcription",
                                          "audio could not be prepared: " + norm.error().message));
    }
    audio::PcmBuffer pcm;
    const bool read_ok = audio::read_wav(norm.value(), pcm);
    std::error_code ec;
    fs::remove(wav16, ec);
    if (!read_ok || pcm.sample_rate != kWhisperRate) {
        return make_unexpected(make_error(ErrorCode::Transcription, "transcription", "prepared audio is unreadable"));
    }
    pcm = audio::downmix_to_mono(pcm);

    whisper_full_params wp = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    const bool verbose = core::log_level() == core::LogLevel::Debug;
    wp.print_realtime = false;
    wp.print_progress = false;
    wp.print_timestamps = verbose;
    wp.print_special = false;
    wp.translate = false;
    wp.language = language.empty() ? "auto" : language.c_str();
    wp.detect_language = false;
    wp.n_threads = opts_.threads > 0 ? opts_.threads
                                     : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    wp.greedy.best_of = 1;

    const int ret = whisper_full(ctx_, wp, pcm.samples.data(), static_cast<int>(pcm.samples.size()));
    if (ret != 0) {
        core::log_error("[whisper] whisper_full FAILED, ret=" + std::to_string(ret));
        return make_unexpected(make_error(ErrorCode::Transcription, "transcription", "speech recognition failed"));
    }

    TranscriptionResult result;
    result.duration_seconds = pcm.duration_seconds();
    double conf_sum = 0.0;
    const int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text(ctx_, i);
        std::string text = clean_segment_text(txt ? txt : "");
        if (text.empty()) continue;

        Utterance u;
        u.start = whisper_full_get_segment_t0(ctx_, i) / 100.0;  // centiseconds
        u.end = whisper_full_get_segment_t1(ctx_, i) / 100.0;
        u.text = text;

        const int nt = whisper_full_n_tokens(ctx_, i);
        double p = 0.0;
        int counted = 0;
        for (int t = 0; t < nt; ++t) {
            if (whisper_full_get_token_id(ctx_, i, t) >= whisper_token_eot(ctx_)) continue;  // special tokens
            p += whisper_full_get_token_p(ctx_, i, t);
            ++counted;
        }
        u.confidence = counted > 0 ? static_cast<float>(p / counted) : 0.0f;
        conf_sum += u.confidence;

        if (!result.transcript.empty()) result.transcript += ' ';
        result.transcript += text;
        result.utterances.push_back(std::move(u));
    }
    if (!result.utterances.empty()) result.confidence = static_cast<float>(conf_sum / result.utterances.size());

    if (diarize_speakers && !result.utterances.empty()) diarize(pcm.samples, result.utterances);

    core::log_info("[whisper] " + std::to_string(result.utterances.size()) + " utterances, " +
                   std::to_string(result.duration_seconds) + "s");
    return result;
}

void WhisperTranscriber::diarize(const std::vector<float>& pcm, std::vector<Utterance>& utts) {
    if (!embedder_ && !embedder_failed_) {
        try {
            diar::SpeakerEmbedder::Config cfg;
            cfg.model_path = opts_.speaker_model;
            cfg.sample_rate = kWhisperRate;
            embedder_ = std::make_unique<diar::SpeakerEmbedder>(cfg);
        } catch (const std::exception& e) {
            embedder_failed_ = true;
            core::log_warn(std::string("[diar] ") + e.what() + "; all speech attributed to speaker 0");
        }
    }
    if (!embedder_) {
        for (auto& u : utts) u.speaker_id = 0;
        return;
    }

    // 1 s windows with 0.5 s hop; each utterance takes the majority speaker of its windows.
    const size_t win = kWhisperRate;
    const size_t hop = kWhisperRate / 2;
    diar::SpeakerClusterer clusterer(opts_.max_speakers);
    int previous = 0;
    for (auto& u : utts) {
        const size_t b = std::min(pcm.size(), static_cast<size_t>(std::max(0.0, u.start) * kWhisperRate));
        const size_t e = std::min(pcm.size(), static_cast<size_t>(std::max(0.0, u.end) * kWhisperRate));
        std::vector<int> votes;
        if (e > b && e - b <= win + hop) {
            votes.push_back(clusterer.assign(embedder_->embed(pcm.data() + b, e - b)));
        } else {
            for (size_t pos = b; pos + win <= e; pos += hop) {
                votes.push_back(clusterer.assign(embedder_->embed(pcm.data() + pos, win)));
            }
        }
        u.speaker_id = diar::SpeakerClusterer::majority(votes, previous);
        previous = u.speaker_id;
    }
    core::log_info("[diar] " + std::to_string(clusterer.num_speakers()) + " speakers");
}

}
