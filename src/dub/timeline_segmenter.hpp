#pragma once
#include <vector>
#include "asr/transcriber.hpp"
#include "dub/segment.hpp"

namespace dub {

struct SegmenterSettings {
    double silence_gap_s = 0.1;   // gaps at least this long become silence segments
    double min_speech_s = 0.05;
};

class TimelineSegmenter {
public:
    explicit TimelineSegmenter(SegmenterSettings s = {}) : s_(s) {}

    // Builds a gap-free timeline over [0, total_duration). Shorter gaps are
    // absorbed into the following speech segment; a short tail extends the
    // last segment. No utterances yields one silence segment.
    Timeline build(const std::vector<asr::Utterance>& utterances, double total_duration) const;

private:
    SegmenterSettings s_;
};

// Sum of durations; equals the total for any timeline built above.
double timeline_duration(const Timeline& t);

}
