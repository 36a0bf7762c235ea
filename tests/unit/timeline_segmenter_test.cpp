#include <cassert>
#include <cmath>
#include <vector>
#include "core/logging.hpp"
#include "dub/timeline_segmenter.hpp"

static asr::Utterance utt(double s, double e, const char* text, int spk) {
    asr::Utterance u;
    u.start = s;
    u.end = e;
    u.text = text;
    u.speaker_id = spk;
    u.confidence = 0.9f;
    return u;
}

// Contiguous, ordered, non-overlapping, covering [0, total).
static void check_coverage(const dub::Timeline& t, double total) {
    assert(!t.empty());
    assert(std::fabs(t.front().start) < 1e-9);
    for (size_t i = 0; i < t.size(); ++i) {
        assert(t[i].end >= t[i].start);
        assert(std::fabs(t[i].duration - (t[i].end - t[i].start)) < 1e-9);
        if (i > 0) assert(std::fabs(t[i].start - t[i - 1].end) < 1e-9);
        if (!t[i].is_silence) assert(!t[i].text.empty());
    }
    assert(std::fabs(t.back().end - total) < 1e-6);
    assert(std::fabs(dub::timeline_duration(t) - total) < 1e-6);
}

int main() {
    core::set_log_level(core::LogLevel::Warn);
    dub::TimelineSegmenter seg;

    // two speakers with silences between and after
    {
        auto t = seg.build({utt(0, 4, "hello there", 0), utt(5, 9, "general greeting", 1)}, 10.0);
        assert(t.size() == 4);
        assert(!t[0].is_silence && t[0].speaker_id == 0);
        assert(t[1].is_silence && std::fabs(t[1].duration - 1.0) < 1e-9);
        assert(!t[2].is_silence && t[2].speaker_id == 1);
        assert(t[3].is_silence && std::fabs(t[3].start - 9.0) < 1e-9);
        check_coverage(t, 10.0);
    }

    // leading silence
    {
        auto t = seg.build({utt(1.5, 3.0, "late start", 0)}, 3.0);
        assert(t.size() == 2);
        assert(t[0].is_silence && std::fabs(t[0].end - 1.5) < 1e-9);
        check_coverage(t, 3.0);
    }

    // no utterances: one silence over everything
    {
        auto t = seg.build({}, 7.25);
        assert(t.size() == 1 && t[0].is_silence);
        check_coverage(t, 7.25);
    }

    // gap below threshold is absorbed into the next speech segment
    {
        auto t = seg.build({utt(0, 2.0, "a", 0), utt(2.05, 4.0, "b", 1)}, 4.0);
        assert(t.size() == 2);
        assert(std::fabs(t[1].start - 2.0) < 1e-9);
        check_coverage(t, 4.0);
    }

    // short tail extends the last segment instead of a sliver of silence
    {
        auto t = seg.build({utt(0, 2.95, "tail", 0)}, 3.0);
        assert(t.size() == 1 && !t[0].is_silence);
        check_coverage(t, 3.0);
    }

    // degenerate zero-length utterance gets the 0.05 s minimum
    {
        auto t = seg.build({utt(1.0, 1.0, "blip", 0)}, 2.0);
        assert(t.size() == 3);
        assert(std::fabs(t[1].duration - 0.05) < 1e-9);
        check_coverage(t, 2.0);
    }

    // overlapping / out-of-range / empty-text utterances stay consistent
    {
        auto t = seg.build({utt(0.0, 3.0, "one", 0), utt(2.5, 4.0, "two", 1), utt(4.2, 4.4, "   ", 0),
                            utt(5.0, 12.0, "beyond", 1)},
                           6.0);
        check_coverage(t, 6.0);
        assert(std::fabs(t.back().end - 6.0) < 1e-9 && !t.back().is_silence);
    }

    // many random-ish utterances
    {
        std::vector<asr::Utterance> us;
        double at = 0.3;
        for (int i = 0; i < 50; ++i) {
            const double len = 0.2 + (i % 7) * 0.31;
            us.push_back(utt(at, at + len, "words", i % 3));
            at += len + ((i % 4) * 0.07);
        }
        auto t = seg.build(us, at + 1.0);
        check_coverage(t, at + 1.0);
    }
    return 0;
}
