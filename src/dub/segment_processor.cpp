#include "dub/segment_processor.hpp"
#include "core/logging.hpp"
#include "dub/chunked_ops.hpp"
#include "dub/chunker.hpp"
#include <cstdio>
#include <filesystem>

namespace dub {

std::string SegmentProcessor::segment_path(size_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "seg_%05zu.wav", index);
    return (std::filesystem::path(job_.work_dir) / name).string();
}

TranslatedSegment SegmentProcessor::translate(const Segment& seg) {
    TranslatedSegment out;
    if (seg.is_silence) {
        out.ok = true;
        return out;
    }
    auto r = translate_chunked(translator_, split_for_processing(seg.text, job_.max_chunk_chars),
                               job_.target_language, job_.source_language);
    if (r) {
        out.chunks = std::move(r.value());
        out.ok = true;
    } else {
        out.error = r.error();
    }
    return out;
}

core::Expected<audio::MatchResult, core::Error> SegmentProcessor::synthesize(
    size_t index, const Segment& seg, const std::vector<std::string>& translated) {
    SynthesisTarget target;
    target.work_dir = job_.work_dir;
    target.stem = "seg_" + std::to_string(index);
    target.sample_rate = job_.sample_rate;

    auto speech = synthesize_chunked(synthesizer_, runner_, translated, job_.target_language, seg.voice_id, target);
    if (!speech) return core::make_unexpected(speech.error());

    auto matched = matcher_.match_duration(speech.value(), seg.duration, segment_path(index));
    std::error_code ec;
    std::filesystem::remove(speech.value(), ec);
    return matched;
}

core::Expected<audio::MatchResult, core::Error> SegmentProcessor::silence(size_t index, const Segment& seg) {
    return matcher_.silence_clip(seg.duration, segment_path(index));
}

core::Expected<SegmentAudio, core::Error> SegmentProcessor::render(size_t index, const Segment& seg,
                                                                   const TranslatedSegment& tr) {
    SegmentAudio out;
    out.audio.segment_index = index;

    if (!seg.is_silence) {
        core::Error failure;
        if (!tr.ok) {
            failure = tr.error;
        } else if (join_translated(tr.chunks).empty()) {
            failure = core::make_error(core::ErrorCode::Translation, "translation", "translation is empty");
        } else {
            auto m = synthesize(index, seg, tr.chunks);
            if (m) {
                out.audio.file_path = m.value().path;
                out.audio.actual_duration = m.value().output_duration;
                out.action = m.value().action;
                return out;
            }
            failure = m.error();
        }
        core::log_warn("[segment] " + job_.target_language + " #" + std::to_string(index) + " falls back to silence: " +
                       failure.describe());
        out.substituted = true;
    }

    auto s = silence(index, seg);
    if (!s) return core::make_unexpected(s.error());
    out.audio.file_path = s.value().path;
    out.audio.actual_duration = s.value().output_duration;
    out.action = audio::MatchAction::Silence;
    return out;
}

}
