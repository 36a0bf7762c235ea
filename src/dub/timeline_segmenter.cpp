#include "dub/timeline_segmenter.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace dub {

namespace {

Segment silence(double start, double end) {
    Segment s;
    s.start = start;
    s.end = end;
    s.duration = end - start;
    s.is_silence = true;
    return s;
}

bool blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

Timeline TimelineSegmenter::build(const std::vector<asr::Utterance>& utterances, double total) const {
    Timeline out;
    total = std::max(0.0, total);

    std::vector<asr::Utterance> ordered = utterances;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const asr::Utterance& a, const asr::Utterance& b) { return a.start < b.start; });

    double prev_end = 0.0;
    for (const auto& u : ordered) {
        if (blank(u.text)) continue;
        double start = std::clamp(u.start, prev_end, total);
        double end = std::clamp(u.end, start, total);
        if (end - start < s_.min_speech_s) end = std::min(start + s_.min_speech_s, total);
        if (end <= start) continue;

        if (start - prev_end >= s_.silence_gap_s) {
            out.push_back(silence(prev_end, start));
        } else {
            start = prev_end;
        }

        Segment seg;
        seg.start = start;
        seg.end = end;
        seg.duration = end - start;
        seg.is_silence = false;
        seg.text = u.text;
        seg.speaker_id = u.speaker_id;
        out.push_back(std::move(seg));
        prev_end = end;
    }

    const double rest = total - prev_end;
    if (out.empty()) {
        out.push_back(silence(0.0, total));
    } else if (rest > s_.silence_gap_s) {
        out.push_back(silence(prev_end, total));
    } else if (rest > 0.0) {
        out.back().end = total;
        out.back().duration = total - out.back().start;
    }

    core::log_debug("[timeline] " + std::to_string(out.size()) + " segments over " + std::to_string(total) + "s");
    return out;
}

double timeline_duration(const Timeline& t) {
    double sum = 0.0;
    for (const auto& s : t) sum += s.duration;
    return sum;
}

}
