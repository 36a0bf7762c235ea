#include <cassert>
#include <cmath>
#include "audio/duration_matcher.hpp"
#include "core/logging.hpp"
#include "core/scoped_temp_dir.hpp"
#include "fakes.hpp"

int main() {
    core::set_log_level(core::LogLevel::Error);
    core::ScopedTempDir tmp("matcher_test_");
    fakes::FakeToolRunner runner;
    audio::DurationMatcher matcher(runner, audio::DurationMatcherConfig{});

    auto speech = [&](const std::string& name, double seconds, int rate = 44100) {
        return fakes::write_tmp(tmp.path(), name, fakes::sine(seconds, 180.0f, rate));
    };

    // tiny target: pure silence, input ignored
    {
        auto r = matcher.match_duration(speech("a.wav", 1.0), 0.03, tmp.file("a_out.wav"));
        assert(r && r.value().action == audio::MatchAction::Silence);
        audio::PcmBuffer b;
        assert(audio::read_wav(r.value().path, b));
        assert(std::fabs(b.duration_seconds() - 0.03) < 1e-3);
        assert(audio::peak_abs(b) == 0.0f);
    }

    // within tolerance: pass through unchanged (format-normalized only)
    {
        auto r = matcher.match_duration(speech("b.wav", 2.02, 22050), 2.0, tmp.file("b_out.wav"));
        assert(r && r.value().action == audio::MatchAction::PassThrough);
        assert(std::fabs(r.value().output_duration - 2.02) < 1e-3);
        audio::PcmBuffer b;
        assert(audio::read_wav(r.value().path, b));
        assert(b.sample_rate == 44100 && b.channels == 1);
    }

    // shorter: padded with trailing silence to the exact target
    {
        auto r = matcher.match_duration(speech("c.wav", 1.0), 2.5, tmp.file("c_out.wav"));
        assert(r && r.value().action == audio::MatchAction::Padded);
        audio::PcmBuffer b;
        assert(audio::read_wav(r.value().path, b));
        assert(b.frames() == audio::frames_for(2.5, 44100));
        auto tail = audio::slice(b, 1.1, 2.5);
        assert(audio::peak_abs(tail) == 0.0f);
    }

    // moderately longer: stretched, then cut to length
    {
        const int before = runner.stretch_calls;
        auto r = matcher.match_duration(speech("d.wav", 2.5), 2.0, tmp.file("d_out.wav"));
        assert(r && r.value().action == audio::MatchAction::Stretched);
        assert(runner.stretch_calls == before + 1);
        assert(std::fabs(r.value().speed_factor - 1.25) < 1e-3);
        assert(std::fabs(fakes::wav_seconds(r.value().path) - 2.0) < 1e-3);
    }

    // ratio 1.4 exceeds the stretch ceiling: trimmed, no tempo change
    {
        const int before = runner.stretch_calls;
        auto r = matcher.match_duration(speech("e.wav", 2.8), 2.0, tmp.file("e_out.wav"));
        assert(r && r.value().action == audio::MatchAction::Trimmed);
        assert(runner.stretch_calls == before);
        assert(std::fabs(fakes::wav_seconds(r.value().path) - 2.0) < 1e-3);
    }

    // just under the ceiling still stretches
    {
        const int before = runner.stretch_calls;
        auto r = matcher.match_duration(speech("f.wav", 2.69), 2.0, tmp.file("f_out.wav"));
        assert(r && r.value().action == audio::MatchAction::Stretched);
        assert(runner.stretch_calls == before + 1);
    }

    // every branch lands within tolerance of the target
    const double inputs[] = {0.2, 0.9, 1.0, 1.04, 1.2, 1.6, 3.0};
    int n = 0;
    for (double in : inputs) {
        auto r = matcher.match_duration(speech("g" + std::to_string(n) + ".wav", in), 1.0,
                                        tmp.file("g" + std::to_string(n) + "_out.wav"));
        ++n;
        assert(r);
        assert(std::fabs(fakes::wav_seconds(r.value().path) - 1.0) <= 0.05 + 1e-6);
    }

    // tool failure comes back as a value, not an exception
    {
        const std::string bad = speech("h.wav", 1.0);
        runner.fail_normalize_for.insert(bad);
        auto r = matcher.match_duration(bad, 1.0, tmp.file("h_out.wav"));
        assert(!r);
        assert(r.error().code == core::ErrorCode::ToolFailure);
    }
    return 0;
}
