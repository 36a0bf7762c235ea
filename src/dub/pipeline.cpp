#include "dub/pipeline.hpp"
#include "audio/duration_matcher.hpp"
#include "audio/media_probe.hpp"
#include "audio/mixer.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/timeline_reconstructor.hpp"
#include "audio/wav_io.hpp"
#include "core/bounded_executor.hpp"
#include "core/logging.hpp"
#include "core/scoped_temp_dir.hpp"
#include "diar/voice_assigner.hpp"
#include "dub/chunker.hpp"
#include "dub/segment_processor.hpp"
#include "dub/speaker_samples.hpp"
#include "dub/timeline_segmenter.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>

namespace dub {

namespace fs = std::filesystem;

namespace {

audio::DurationMatcherConfig matcher_config(const core::Config& c) {
    audio::DurationMatcherConfig m;
    m.sample_rate = c.sample_rate;
    m.tolerance_s = c.duration_tolerance_s;
    m.max_stretch = c.max_stretch_factor;
    return m;
}

audio::MixSettings mix_settings(const core::Config& c) {
    audio::MixSettings m;
    m.sample_rate = c.sample_rate;
    m.voice_gain = c.voice_gain;
    m.background_gain = c.background_gain;
    m.ducking = c.ducking;
    m.ducking_threshold = c.ducking_threshold;
    m.ducking_ratio = c.ducking_ratio;
    m.ducking_window_s = c.ducking_window_s;
    m.headroom = c.peak_headroom;
    return m;
}

ExportSettings export_settings(const core::Config& c) {
    ExportSettings e;
    e.output_dir = c.output_dir;
    e.format = c.export_format;
    e.captions = c.captions;
    e.archive = c.archive;
    return e;
}

// Serializes progress reporting across language workers. Milestones are
// translation, synthesis and mixing per language, between 20% and 100%.
class ProgressReporter {
public:
    ProgressReporter(const ProgressCallback& cb, size_t languages) : cb_(cb), total_(languages * 3) {}

    void report(int percent, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mu_);
        core::log_info("[progress] " + std::to_string(percent) + "% " + msg);
        if (cb_) cb_(percent, msg);
    }

    void milestone(const std::string& msg) {
        std::lock_guard<std::mutex> lk(mu_);
        ++done_;
        const int percent = total_ == 0 ? 95 : 20 + static_cast<int>(75 * done_ / total_);
        core::log_info("[progress] " + std::to_string(percent) + "% " + msg);
        if (cb_) cb_(percent, msg);
    }

private:
    const ProgressCallback& cb_;
    size_t total_;
    size_t done_ = 0;
    std::mutex mu_;
};

// Read-only state shared by every language run of one job.
struct JobContext {
    const PipelineRequest* request = nullptr;
    const asr::TranscriptionResult* transcription = nullptr;
    const Timeline* timeline = nullptr;
    const std::vector<diar::SpeakerProfile>* profiles = nullptr;
    std::string background_wav;   // canonical, empty when none
    double total_duration = 0.0;
};

LanguageOutcome failed(const std::string& language, const core::Error& e) {
    LanguageOutcome o;
    o.ok = false;
    o.result.language_code = language;
    o.error = e;
    return o;
}

} // namespace

DubbingPipeline::DubbingPipeline(asr::Transcriber& transcriber, Translator& translator, Synthesizer& synthesizer,
                                 audio::AudioToolRunner& runner, const diar::VoiceCatalog& catalog,
                                 const core::Config& config)
    : transcriber_(transcriber), translator_(translator), synthesizer_(synthesizer), runner_(runner),
      catalog_(catalog), config_(config) {}

std::map<std::string, LanguageOutcome> DubbingPipeline::run(const PipelineRequest& request,
                                                            const ProgressCallback& progress) {
    std::map<std::string, LanguageOutcome> outcomes;
    ProgressReporter reporter(progress, request.target_languages.size());
    auto fail_all = [&](const core::Error& e) {
        core::log_error("[pipeline] job " + request.job_id + " failed: " + e.describe());
        for (const auto& lang : request.target_languages) outcomes[lang] = failed(lang, e);
        return outcomes;
    };

    std::unique_ptr<core::ScopedTempDir> temp;
    try {
        temp = std::make_unique<core::ScopedTempDir>("dubline_" + request.job_id + "_", config_.work_root);
    } catch (const std::exception& e) {
        return fail_all(core::make_error(core::ErrorCode::ToolFailure, "setup", e.what()));
    }

    // Probe and canonicalize the voice input.
    audio::MediaProbe probe(runner_);
    audio::MediaInfo voice_info;
    std::string voice_wav;
    try {
        voice_wav = probe.prepare_canonical(request.voice_path, temp->path().string(), "voice",
                                            config_.sample_rate, voice_info);
    } catch (const core::PipelineError& e) {
        return fail_all(e.error());
    }
    reporter.report(5, "Media analyzed");

    JobContext ctx;
    ctx.request = &request;
    if (!request.background_path.empty()) {
        try {
            audio::MediaInfo bg_info;
            ctx.background_wav = probe.prepare_canonical(request.background_path, temp->path().string(),
                                                         "background", config_.sample_rate, bg_info);
        } catch (const core::PipelineError& e) {
            core::log_warn("[pipeline] background unusable, output will be voice only: " + e.error().describe());
        }
    }

    auto transcription = transcriber_.transcribe(voice_wav, request.source_language, true);
    if (!transcription) return fail_all(transcription.error());
    reporter.report(20, "Transcription complete");

    audio::PcmBuffer voice_pcm;
    if (!audio::read_wav(voice_wav, voice_pcm)) {
        return fail_all(core::make_error(core::ErrorCode::ToolFailure, "probe", "canonical voice audio is unreadable"));
    }
    ctx.total_duration = voice_info.duration_seconds > 0.0 ? voice_info.duration_seconds : voice_pcm.duration_seconds();

    TimelineSegmenter segmenter({config_.silence_gap_s, config_.min_speech_s});
    const Timeline timeline = segmenter.build(transcription.value().utterances, ctx.total_duration);
    const std::vector<diar::SpeakerProfile> profiles =
        estimate_speaker_profiles(voice_pcm, transcription.value().utterances, config_.speaker_sample_min_s);
    voice_pcm = audio::PcmBuffer{};

    ctx.transcription = &transcription.value();
    ctx.timeline = &timeline;
    ctx.profiles = &profiles;
    core::log_info("[pipeline] job " + request.job_id + ": " + std::to_string(timeline.size()) + " segments, " +
                   std::to_string(profiles.size()) + " speaker profiles, " +
                   std::to_string(request.target_languages.size()) + " languages");

    std::mutex outcomes_mu;
    auto run_language = [&](const std::string& lang) -> LanguageOutcome {
        const fs::path dir = temp->subdir(lang);

        Timeline segments = *ctx.timeline;
        const diar::VoiceAssignment voices = diar::assign_voices(*ctx.profiles, catalog_.for_language(lang));
        for (auto& s : segments) {
            if (!s.is_silence) s.voice_id = voices.voice_for(s.speaker_id);
        }

        audio::DurationMatcher matcher(runner_, matcher_config(config_));
        SegmentJob job;
        job.source_language = request.source_language;
        job.target_language = lang;
        job.work_dir = dir.string();
        job.max_chunk_chars = config_.max_chunk_chars;
        job.sample_rate = config_.sample_rate;
        SegmentProcessor processor(translator_, synthesizer_, runner_, matcher, job);

        std::vector<TranslatedSegment> translated;
        translated.reserve(segments.size());
        std::vector<std::string> translated_texts;
        std::vector<CaptionCue> cues;
        for (const auto& s : segments) {
            translated.push_back(processor.translate(s));
            const auto& t = translated.back();
            if (!s.is_silence && t.ok) {
                translated_texts.push_back(join_translated(t.chunks));
                const auto seg_cues = cues_for_segment(s, t.chunks);
                cues.insert(cues.end(), seg_cues.begin(), seg_cues.end());
            }
        }
        reporter.milestone("Translation to " + lang + " complete");

        LanguageOutcome out;
        out.segments = segments.size();
        std::vector<audio::ProcessedSegmentAudio> pieces;
        pieces.reserve(segments.size());
        for (size_t i = 0; i < segments.size(); ++i) {
            auto r = processor.render(i, segments[i], translated[i]);
            if (!r) throw core::ReconstructionError("segment " + std::to_string(i) + ": " + r.error().message);
            if (r.value().substituted) ++out.substituted_segments;
            pieces.push_back(r.value().audio);
        }
        reporter.milestone("Speech synthesis for " + lang + " complete");

        audio::TimelineReconstructor reconstructor(config_.sample_rate);
        const std::string voice_track =
            reconstructor.reconstruct(pieces, (dir / "voice_track.wav").string(), ctx.total_duration);
        for (const auto& p : pieces) {
            std::error_code ec;
            fs::remove(p.file_path, ec);
        }

        std::string mixed = (dir / "mixed.wav").string();
        audio::Mixer mixer(runner_, mix_settings(config_));
        try {
            mixer.mix(voice_track, ctx.background_wav, mixed);
            out.mixed_with_background = !ctx.background_wav.empty();
        } catch (const core::MixingError& e) {
            core::log_warn("[pipeline] " + lang + " mixing failed, using voice-only track: " + e.error().describe());
            mixed = voice_track;
        }
        reporter.milestone("Mixing for " + lang + " complete");

        Exporter exporter(runner_, export_settings(config_));
        out.files = exporter.export_language(request.job_id, lang, voice_track, mixed, cues);
        out.ok = true;
        out.result.language_code = lang;
        out.result.final_audio_path = out.files.full_mix;
        out.result.transcript_text = ctx.transcription->transcript;
        out.result.translated_text = join_translated(translated_texts);
        return out;
    };

    {
        core::BoundedExecutor executor(config_.max_workers);
        for (const auto& lang : request.target_languages) {
            executor.submit([&, lang] {
                LanguageOutcome o;
                try {
                    o = run_language(lang);
                } catch (const core::PipelineError& e) {
                    o = failed(lang, e.error());
                } catch (const std::exception& e) {
                    o = failed(lang, core::make_error(core::ErrorCode::ToolFailure, "pipeline", e.what()));
                }
                if (o.ok) {
                    core::log_info("[pipeline] " + lang + " done: " + std::to_string(o.substituted_segments) + "/" +
                                   std::to_string(o.segments) + " segments substituted");
                } else {
                    core::log_error("[pipeline] " + lang + " failed: " + o.error.describe());
                }
                std::lock_guard<std::mutex> lk(outcomes_mu);
                outcomes[lang] = std::move(o);
            });
        }
        executor.wait_all();
    }

    reporter.report(100, "Dubbing complete");
    return outcomes;
}

}
