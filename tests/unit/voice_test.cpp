#include <cassert>
#include <cmath>
#include <string>
#include <vector>
#include "core/logging.hpp"
#include "diar/pitch_estimator.hpp"
#include "diar/voice_assigner.hpp"
#include "diar/voice_catalog.hpp"
#include "dub/speaker_samples.hpp"
#include "fakes.hpp"

static void test_pitch() {
    for (float hz : {100.0f, 200.0f, 320.0f}) {
        auto b = fakes::sine(1.0, hz);
        const float est = diar::estimate_pitch(b.samples.data(), b.samples.size(), b.sample_rate);
        assert(std::fabs(est - hz) < hz * 0.03f);
    }
    // 16 kHz input needs no decimation
    auto b16 = fakes::sine(0.5, 150.0f, 16000);
    assert(std::fabs(diar::estimate_pitch(b16.samples.data(), b16.samples.size(), 16000) - 150.0f) < 5.0f);

    // silence and too-short input are unvoiced
    std::vector<float> quiet(44100, 0.0f);
    assert(diar::estimate_pitch(quiet.data(), quiet.size(), 44100) == 0.0f);
    assert(diar::estimate_pitch(quiet.data(), 100, 44100) == 0.0f);
    assert(diar::estimate_pitch(nullptr, 0, 44100) == 0.0f);
}

static void test_rank_matching() {
    diar::LanguageVoices cat;
    cat.default_voice = "A";
    cat.voices = {{"B", 200.0f, "female"}, {"A", 100.0f, "male"}};

    // lower-pitched speaker gets the lower voice, regardless of nearest distance
    auto a = diar::assign_voices({{1, 180.0f}, {2, 90.0f}}, cat);
    assert(a.voice_for(2) == "A");
    assert(a.voice_for(1) == "B");
    // deterministic
    auto again = diar::assign_voices({{1, 180.0f}, {2, 90.0f}}, cat);
    assert(again.by_speaker == a.by_speaker);

    // rank, not nearest: both speakers are near 200 Hz but still spread over the catalog
    auto r = diar::assign_voices({{5, 205.0f}, {6, 195.0f}}, cat);
    assert(r.voice_for(6) == "A" && r.voice_for(5) == "B");

    // more speakers than voices wraps around (i mod size)
    auto w = diar::assign_voices({{0, 300.0f}, {1, 100.0f}, {2, 200.0f}}, cat);
    assert(w.voice_for(1) == "A");
    assert(w.voice_for(2) == "B");
    assert(w.voice_for(0) == "A");

    // equal pitch keeps input order; estimation failures (0 Hz) sort first
    auto t = diar::assign_voices({{7, 0.0f}, {8, 0.0f}}, cat);
    assert(t.voice_for(7) == "A" && t.voice_for(8) == "B");

    // unknown speaker gets the default
    assert(a.voice_for(42) == "A");
}

static void test_catalog() {
    auto c = diar::VoiceCatalog::builtin();
    const auto& es = c.for_language("es");
    assert(es.voices.size() == 2);
    assert(es.voices[0].voice_name == "aura-2-nestor-es");
    assert(es.default_voice == "aura-2-celeste-es");
    assert(c.for_language("xx").default_voice == "aura-asteria-en");

    diar::VoiceCatalog loaded;
    std::string err;
    const std::string json =
        R"({"fr": {"default": "f-high", "voices": [{"name": "f-high", "pitch": 230, "gender": "female"},)"
        R"( {"name": "f-low", "pitch": 110, "gender": "male"}]}})";
    assert(diar::VoiceCatalog::from_json(json, c, loaded, err));
    assert(loaded.has_language("fr") && loaded.has_language("es"));
    assert(loaded.for_language("fr").voices.front().voice_name == "f-low");

    assert(!diar::VoiceCatalog::from_json("[1,2]", c, loaded, err));
    assert(!err.empty());
    assert(!diar::VoiceCatalog::from_json(R"({"de": {"voices": []}})", c, loaded, err));
}

static void test_speaker_samples() {
    auto u = [](double s, double e, int spk) {
        asr::Utterance x;
        x.start = s;
        x.end = e;
        x.text = "t";
        x.speaker_id = spk;
        return x;
    };
    std::vector<asr::Utterance> us = {u(0, 0.4, 3), u(0.5, 2.0, 1), u(2.0, 2.5, 1), u(3.0, 6.0, 1), u(6.0, 6.5, 2)};
    auto best = dub::select_speaker_samples(us, 0.5);
    assert(best.size() == 1);  // speaker 2's 0.5 s is not strictly longer; speaker 3 too short
    assert(best.at(1).start == 3.0);

    // pitch of each speaker's longest sample
    audio::PcmBuffer voice = fakes::sine(4.0, 200.0f);
    audio::append(voice, fakes::sine(1.0, 0.0f, 44100, 0.0f));
    audio::append(voice, fakes::sine(4.0, 100.0f));
    auto profiles = dub::estimate_speaker_profiles(voice, {u(0, 4, 0), u(5, 9, 1), u(9.0, 9.2, 2)}, 0.5);
    assert(profiles.size() == 2);
    assert(profiles[0].speaker_id == 0 && std::fabs(profiles[0].estimated_pitch_hz - 200.0f) < 6.0f);
    assert(profiles[1].speaker_id == 1 && std::fabs(profiles[1].estimated_pitch_hz - 100.0f) < 3.0f);
}

static void test_unvoiced_speakers_rank_by_id() {
    auto u = [](double s, double e, int spk) {
        asr::Utterance x;
        x.start = s;
        x.end = e;
        x.text = "t";
        x.speaker_id = spk;
        return x;
    };
    // speaker 1 talks first; both samples are silent so both pitches are 0 Hz
    audio::PcmBuffer quiet = fakes::sine(4.0, 0.0f, 44100, 0.0f);
    auto profiles = dub::estimate_speaker_profiles(quiet, {u(0.0, 1.5, 1), u(2.0, 3.5, 0)}, 0.5);
    assert(profiles.size() == 2);
    assert(profiles[0].speaker_id == 0 && profiles[1].speaker_id == 1);
    assert(profiles[0].estimated_pitch_hz == 0.0f && profiles[1].estimated_pitch_hz == 0.0f);

    diar::LanguageVoices cat;
    cat.default_voice = "A";
    cat.voices = {{"A", 100.0f, "male"}, {"B", 200.0f, "female"}};
    auto m = diar::assign_voices(profiles, cat);
    assert(m.voice_for(0) == "A");
    assert(m.voice_for(1) == "B");
}

int main() {
    core::set_log_level(core::LogLevel::Warn);
    test_pitch();
    test_rank_matching();
    test_catalog();
    test_speaker_samples();
    test_unvoiced_speakers_rank_by_id();
    return 0;
}
