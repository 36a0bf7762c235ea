#include <cassert>
#include <cmath>
#include <vector>
#include "asr/whisper_transcriber.hpp"
#include "core/logging.hpp"
#include "diar/fbank.hpp"
#include "diar/speaker_clusterer.hpp"
#include "diar/speaker_embedder.hpp"
#include "fakes.hpp"

static void test_fbank() {
    diar::FbankExtractor fb;
    assert(fb.num_frames(399) == 0);
    assert(fb.num_frames(16000) == 98);

    const auto tone = fakes::sine(1.0, 440.0f, 16000);
    const auto feats = fb.compute(tone.samples.data(), tone.samples.size());
    assert(feats.size() == 98u * 80u);
    for (float v : feats) assert(std::isfinite(v));

    // mean-normalized: every mel band averages to ~0 over frames
    for (int m = 0; m < fb.n_mels(); ++m) {
        double sum = 0.0;
        for (int t = 0; t < 98; ++t) sum += feats[t * 80 + m];
        assert(std::fabs(sum / 98.0) < 1e-3);
    }
    assert(fb.compute(tone.samples.data(), 100).empty());
}

static void test_clusterer() {
    assert(std::fabs(diar::cosine_similarity({1, 0}, {2, 0}) - 1.0f) < 1e-6f);
    assert(std::fabs(diar::cosine_similarity({1, 0}, {0, 1})) < 1e-6f);

    diar::SpeakerClusterer c(2, 0.55f);
    assert(c.assign({1.0f, 0.0f, 0.0f}) == 0);
    assert(c.assign({0.0f, 1.0f, 0.0f}) == 1);
    assert(c.assign({0.9f, 0.1f, 0.0f}) == 0);
    // speaker limit reached: closest centroid wins
    assert(c.assign({0.0f, 0.2f, 1.0f}) == 1);
    assert(c.num_speakers() == 2);
    assert(c.assign({}) == 1);

    assert(diar::SpeakerClusterer::majority({1, 0, 1, -1}, 0) == 1);
    assert(diar::SpeakerClusterer::majority({0, 1}, 5) == 0);
    assert(diar::SpeakerClusterer::majority({-1, -1}, 3) == 3);
}

static void test_whisper_helpers() {
    assert(asr::clean_segment_text("  Hello world \n") == "Hello world");
    assert(asr::clean_segment_text(" [BLANK_AUDIO] ").empty());
    assert(asr::clean_segment_text("(music)").empty());
    assert(asr::clean_segment_text("   ").empty());
    assert(asr::resolve_whisper_model("/opt/m/ggml-small.bin") == "/opt/m/ggml-small.bin");
    assert(asr::resolve_whisper_model("no-such-model") == "models/ggml-no-such-model.bin");
}

int main() {
    core::set_log_level(core::LogLevel::Error);
    test_fbank();
    test_clusterer();
    test_whisper_helpers();
    return 0;
}
