#include "audio/mixer.hpp"
#include "audio/wav_io.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace audio {

std::vector<float> ducking_mask(const PcmBuffer& voice, const MixSettings& s) {
    const size_t n = voice.samples.size();
    std::vector<float> mask(n, 1.0f);
    if (n == 0 || voice.sample_rate <= 0) return mask;

    const size_t win = std::max<size_t>(1, frames_for(s.ducking_window_s, voice.sample_rate));
    const size_t windows = (n + win - 1) / win;
    std::vector<float> env(windows, 0.0f);
    std::vector<double> centre(windows, 0.0);
    for (size_t w = 0; w < windows; ++w) {
        const size_t b = w * win;
        const size_t e = std::min(n, b + win);
        double acc = 0.0;
        for (size_t i = b; i < e; ++i) acc += static_cast<double>(voice.samples[i]) * voice.samples[i];
        env[w] = static_cast<float>(std::sqrt(acc / static_cast<double>(e - b)));
        centre[w] = 0.5 * static_cast<double>(b + e);
    }

    size_t w = 0;
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        while (w + 1 < windows && centre[w + 1] <= x) ++w;
        float level;
        if (x <= centre[0]) {
            level = env[0];
        } else if (w + 1 >= windows) {
            level = env[windows - 1];
        } else {
            const double t = (x - centre[w]) / (centre[w + 1] - centre[w]);
            level = static_cast<float>(env[w] + t * (env[w + 1] - env[w]));
        }
        mask[i] = level > s.ducking_threshold ? s.ducking_ratio : 1.0f;
    }
    return mask;
}

PcmBuffer mix_buffers(const PcmBuffer& voice, const PcmBuffer* background, const MixSettings& s) {
    PcmBuffer out;
    out.sample_rate = voice.sample_rate;
    out.channels = 1;
    out.samples.resize(voice.samples.size());

    const bool have_bg = background && !background->samples.empty();
    std::vector<float> mask;
    if (have_bg && s.ducking) mask = ducking_mask(voice, s);

    for (size_t i = 0; i < voice.samples.size(); ++i) {
        float v = voice.samples[i] * s.voice_gain;
        if (have_bg) {
            const float g = mask.empty() ? s.background_gain : s.background_gain * mask[i];
            v += background->samples[i % background->samples.size()] * g;
        }
        out.samples[i] = v;
    }

    const float peak = peak_abs(out);
    if (peak > 1.0f) {
        apply_gain(out, s.headroom / peak);
        core::log_debug("[mix] peak " + std::to_string(peak) + " scaled to " + std::to_string(s.headroom));
    }
    return out;
}

PcmBuffer Mixer::load_canonical(const std::string& path, const std::string& scratch, const char* what) {
    if (!std::filesystem::exists(path)) {
        throw core::MixingError(std::string(what) + " track is missing");
    }
    PcmBuffer buf;
    if (read_wav(path, buf) && buf.sample_rate == settings_.sample_rate) {
        return downmix_to_mono(buf);
    }
    auto norm = runner_.normalize(path, scratch, settings_.sample_rate, 1);
    if (!norm) {
        throw core::MixingError(std::string("cannot decode ") + what + " track: " + norm.error().message);
    }
    buf = PcmBuffer{};
    const bool ok = read_wav(norm.value(), buf);
    std::error_code ec;
    std::filesystem::remove(scratch, ec);
    if (!ok) throw core::MixingError(std::string(what) + " track is unreadable");
    return downmix_to_mono(buf);
}

std::string Mixer::mix(const std::string& voice_path, const std::string& background_path,
                       const std::string& out_wav) {
    PcmBuffer voice = load_canonical(voice_path, out_wav + ".voice.wav", "voice");

    PcmBuffer out;
    if (background_path.empty()) {
        out = mix_buffers(voice, nullptr, settings_);
        core::log_info("[mix] voice only, " + std::to_string(out.duration_seconds()) + "s");
    } else {
        PcmBuffer bg = load_canonical(background_path, out_wav + ".bg.wav", "background");
        if (bg.duration_seconds() < voice.duration_seconds() && !bg.empty()) {
            core::log_debug("[mix] looping background (" + std::to_string(bg.duration_seconds()) + "s)");
        }
        out = mix_buffers(voice, &bg, settings_);
        core::log_info(std::string("[mix] voice + background") + (settings_.ducking ? " (ducked)" : "") + ", " +
                       std::to_string(out.duration_seconds()) + "s");
    }

    if (!write_wav(out_wav, out)) throw core::MixingError("could not write mixed track");
    return out_wav;
}

}
