#include "audio/duration_matcher.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/wav_io.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace audio {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

namespace {

// Removes intermediate files when the match finishes, on every path.
struct TempFiles {
    std::vector<std::string> paths;
    ~TempFiles() {
        for (const auto& p : paths) {
            std::error_code ec;
            std::filesystem::remove(p, ec);
        }
    }
};

std::string fmt_seconds(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fs", s);
    return buf;
}

} // namespace

const char* match_action_name(MatchAction a) {
    switch (a) {
    case MatchAction::Silence:     return "silence";
    case MatchAction::PassThrough: return "pass-through";
    case MatchAction::Padded:      return "padded";
    case MatchAction::Stretched:   return "stretched";
    case MatchAction::Trimmed:     return "trimmed";
    }
    return "?";
}

core::Expected<MatchResult, core::Error> DurationMatcher::silence_clip(double duration, const std::string& out_wav) {
    PcmBuffer silence = make_silence(duration, cfg_.sample_rate, 1);
    if (!write_wav(out_wav, silence)) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, "duration-match", "could not write silence clip"));
    }
    MatchResult r;
    r.path = out_wav;
    r.output_duration = silence.duration_seconds();
    r.action = MatchAction::Silence;
    return r;
}

core::Expected<MatchResult, core::Error> DurationMatcher::match_duration(const std::string& input_path,
                                                                         double target,
                                                                         const std::string& out_wav) {
    if (target <= cfg_.min_target_s) {
        return silence_clip(std::max(0.0, target), out_wav);
    }

    TempFiles temps;
    const std::string norm_path = out_wav + ".norm.wav";
    temps.paths.push_back(norm_path);
    auto norm = runner_.normalize(input_path, norm_path, cfg_.sample_rate, 1);
    if (!norm) return make_unexpected(norm.error());

    PcmBuffer audio;
    if (!read_wav(norm.value(), audio)) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, "duration-match", "normalized audio is unreadable"));
    }
    audio = downmix_to_mono(audio);

    MatchResult r;
    r.path = out_wav;
    r.input_duration = audio.duration_seconds();
    const size_t target_frames = frames_for(target, cfg_.sample_rate);

    if (std::fabs(r.input_duration - target) <= cfg_.tolerance_s) {
        r.action = MatchAction::PassThrough;
    } else if (r.input_duration < target) {
        fit_to_frames(audio, target_frames);
        r.action = MatchAction::Padded;
    } else {
        r.speed_factor = r.input_duration / target;
        if (r.speed_factor <= cfg_.max_stretch) {
            const std::string stretched_path = out_wav + ".stretch.wav";
            temps.paths.push_back(stretched_path);
            auto st = runner_.time_stretch(norm.value(), stretched_path, r.speed_factor);
            if (!st) return make_unexpected(st.error());
            PcmBuffer stretched;
            if (!read_wav(st.value(), stretched) || stretched.sample_rate != cfg_.sample_rate) {
                return make_unexpected(make_error(ErrorCode::ToolFailure, "duration-match", "stretched audio is unusable"));
            }
            audio = downmix_to_mono(stretched);
            fit_to_frames(audio, target_frames);
            r.action = MatchAction::Stretched;
        } else {
            fit_to_frames(audio, target_frames);
            r.action = MatchAction::Trimmed;
            core::log_warn("[match] speech " + fmt_seconds(r.input_duration) + " exceeds slot " + fmt_seconds(target) +
                           " beyond max stretch; trimmed, content lost");
        }
    }

    if (!write_wav(out_wav, audio)) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, "duration-match", "could not write matched audio"));
    }
    r.output_duration = audio.duration_seconds();
    core::log_debug("[match] " + std::string(match_action_name(r.action)) + " " + fmt_seconds(r.input_duration) +
                    " -> " + fmt_seconds(r.output_duration) + " (target " + fmt_seconds(target) + ")");
    return r;
}

}
