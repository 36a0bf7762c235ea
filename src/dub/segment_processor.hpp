#pragma once
#include <string>
#include <utility>
#include <vector>
#include "audio/duration_matcher.hpp"
#include "audio/timeline_reconstructor.hpp"
#include "dub/segment.hpp"
#include "dub/synthesizer.hpp"
#include "dub/translator.hpp"

namespace dub {

struct SegmentJob {
    std::string source_language;
    std::string target_language;
    std::string work_dir;
    size_t max_chunk_chars = 1000;
    int sample_rate = 44100;
};

struct TranslatedSegment {
    std::vector<std::string> chunks;  // translated, in order
    core::Error error;                // set when translation failed
    bool ok = false;
};

struct SegmentAudio {
    audio::ProcessedSegmentAudio audio;
    bool substituted = false;         // silence stands in for failed speech
    audio::MatchAction action = audio::MatchAction::Silence;
};

// Per-segment translate -> synthesize -> fit. Failures on one segment are
// returned as values so the caller can substitute silence and move on.
class SegmentProcessor {
public:
    SegmentProcessor(Translator& translator, Synthesizer& synthesizer, audio::AudioToolRunner& runner,
                     audio::DurationMatcher& matcher, SegmentJob job)
        : translator_(translator), synthesizer_(synthesizer), runner_(runner), matcher_(matcher), job_(std::move(job)) {}

    TranslatedSegment translate(const Segment& seg);

    core::Expected<audio::MatchResult, core::Error> synthesize(size_t index, const Segment& seg,
                                                               const std::vector<std::string>& translated);

    // Silence clip of the segment's exact duration.
    core::Expected<audio::MatchResult, core::Error> silence(size_t index, const Segment& seg);

    // Speech when everything succeeds; otherwise silence of the same duration.
    // Only a failure to write the silence itself is returned as an error.
    core::Expected<SegmentAudio, core::Error> render(size_t index, const Segment& seg, const TranslatedSegment& tr);

private:
    std::string segment_path(size_t index) const;

    Translator& translator_;
    Synthesizer& synthesizer_;
    audio::AudioToolRunner& runner_;
    audio::DurationMatcher& matcher_;
    SegmentJob job_;
};

}
