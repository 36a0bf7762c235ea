// In-process stand-ins for ffmpeg and the speech/translation services.
#pragma once
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "asr/transcriber.hpp"
#include "audio/audio_tool_runner.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/wav_io.hpp"
#include "dub/synthesizer.hpp"
#include "dub/translator.hpp"

namespace fakes {

inline audio::PcmBuffer sine(double seconds, float hz, int rate = 44100, float amp = 0.5f) {
    audio::PcmBuffer b;
    b.sample_rate = rate;
    b.channels = 1;
    b.samples.resize(audio::frames_for(seconds, rate));
    for (size_t i = 0; i < b.samples.size(); ++i) {
        b.samples[i] = amp * static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * hz * i / rate));
    }
    return b;
}

inline std::string write_tmp(const std::filesystem::path& dir, const std::string& name, const audio::PcmBuffer& b) {
    const std::string p = (dir / name).string();
    if (!audio::write_wav(p, b)) return {};
    return p;
}

inline double wav_seconds(const std::string& path) {
    audio::PcmBuffer b;
    if (!audio::read_wav(path, b)) return -1.0;
    return b.duration_seconds();
}

// Linear-interpolation resample to `frames` output frames (mono).
inline audio::PcmBuffer resample_frames(const audio::PcmBuffer& in, size_t frames, int rate) {
    audio::PcmBuffer mono = audio::downmix_to_mono(in);
    audio::PcmBuffer out;
    out.sample_rate = rate;
    out.channels = 1;
    out.samples.resize(frames);
    if (mono.samples.empty() || frames == 0) return out;
    const double step = static_cast<double>(mono.samples.size()) / frames;
    for (size_t i = 0; i < frames; ++i) {
        const double pos = i * step;
        const size_t i0 = std::min(mono.samples.size() - 1, static_cast<size_t>(pos));
        const size_t i1 = std::min(mono.samples.size() - 1, i0 + 1);
        const float frac = static_cast<float>(pos - i0);
        out.samples[i] = mono.samples[i0] * (1.0f - frac) + mono.samples[i1] * frac;
    }
    return out;
}

// AudioToolRunner over WAV files only; counts tempo changes.
// A "video" is a WAV file listed in video_inputs; extraction copies its audio.
class FakeToolRunner : public audio::AudioToolRunner {
public:
    std::atomic<int> stretch_calls{0};
    std::atomic<int> encode_calls{0};
    std::atomic<int> extract_calls{0};
    std::set<std::string> fail_normalize_for;  // input paths that fail to decode
    std::set<std::string> corrupt_outputs;     // normalize writes non-WAV bytes to these file names
    std::set<std::string> video_inputs;
    bool probe_timeout = false;
    bool extract_timeout = false;

    core::Expected<audio::MediaInfo, core::Error> probe(const std::string& path) override {
        if (probe_timeout) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ProbeTimeout, "probe", "timed out"));
        }
        audio::PcmBuffer b;
        if (!audio::read_wav(path, b)) {
            return core::make_unexpected(core::make_error(core::ErrorCode::UnsupportedFormat, "probe", "not a wav"));
        }
        audio::MediaInfo info;
        info.duration_seconds = b.duration_seconds();
        info.has_audio = true;
        info.sample_rate = b.sample_rate;
        info.channels = b.channels;
        info.codec = "pcm_s16le";
        info.format = "wav";
        if (video_inputs.count(path)) {
            info.has_video = true;
            info.format = "mov";
        }
        return info;
    }

    core::Expected<std::string, core::Error> extract_audio(const std::string& video, const std::string& out,
                                                           audio::ExtractFormat) override {
        ++extract_calls;
        if (extract_timeout) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ProbeTimeout, "extract", "timed out"));
        }
        audio::PcmBuffer b;
        if (!video_inputs.count(video) || !audio::read_wav(video, b) || !audio::write_wav(out, b)) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ToolFailure, "extract", "no audio track"));
        }
        return out;
    }

    core::Expected<std::string, core::Error> normalize(const std::string& in, const std::string& out,
                                                       int rate, int) override {
        if (corrupt_outputs.count(std::filesystem::path(out).filename().string())) {
            std::ofstream(out, std::ios::binary) << "not audio";
            return out;
        }
        audio::PcmBuffer b;
        if (fail_normalize_for.count(in) || !audio::read_wav(in, b)) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ToolFailure, "normalize", "decode failed"));
        }
        const size_t frames = b.sample_rate == rate ? b.frames() : audio::frames_for(b.duration_seconds(), rate);
        if (!audio::write_wav(out, resample_frames(b, frames, rate))) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ToolFailure, "normalize", "write failed"));
        }
        return out;
    }

    core::Expected<std::string, core::Error> time_stretch(const std::string& in, const std::string& out,
                                                          double tempo) override {
        ++stretch_calls;
        audio::PcmBuffer b;
        if (!audio::read_wav(in, b)) {
            return core::make_unexpected(core::make_error(core::ErrorCode::ToolFailure, "stretch", "decode failed"));
        }
        const size_t frames = static_cast<size_t>(std::llround(b.frames() / tempo));
        audio::write_wav(out, resample_frames(b, frames, b.sample_rate));
        return out;
    }

    core::Expected<std::string, core::Error> encode(const std::string& in, const std::string& out,
                                                    const audio::EncodeOptions&) override {
        ++encode_calls;
        std::error_code ec;
        std::filesystem::copy_file(in, out, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) return core::make_unexpected(core::make_error(core::ErrorCode::ToolFailure, "encode", ec.message()));
        return out;
    }

    core::Expected<std::string, core::Error> archive(const std::vector<std::string>& files,
                                                     const std::string& zip) override {
        std::ofstream f(zip);
        for (const auto& p : files) f << std::filesystem::path(p).filename().string() << "\n";
        return zip;
    }
};

class FakeTranscriber : public asr::Transcriber {
public:
    asr::TranscriptionResult result;
    bool fail = false;

    core::Expected<asr::TranscriptionResult, core::Error> transcribe(const std::string&, const std::string&,
                                                                     bool) override {
        if (fail) {
            return core::make_unexpected(core::make_error(core::ErrorCode::Transcription, "transcription", "model failed"));
        }
        return result;
    }
};

// "<lang>: <text>"; fails for texts containing any of `fail_on`.
class FakeTranslator : public dub::Translator {
public:
    std::vector<std::string> fail_on;
    std::atomic<int> calls{0};

    core::Expected<std::string, core::Error> translate(const std::string& text, const std::string& target,
                                                       const std::string&) override {
        ++calls;
        for (const auto& f : fail_on) {
            if (text.find(f) != std::string::npos) {
                return core::make_unexpected(core::make_error(core::ErrorCode::Translation, "translation", "quota"));
            }
        }
        return target + ": " + text;
    }
};

// Speech is a 150 Hz tone lasting `seconds_per_char` per character (WAV bytes).
class FakeSynthesizer : public dub::Synthesizer {
public:
    explicit FakeSynthesizer(std::filesystem::path scratch) : scratch_(std::move(scratch)) {}

    double seconds_per_char = 0.05;
    std::vector<std::string> fail_on;

    core::Expected<dub::AudioBytes, core::Error> generate_speech(const std::string& text, const std::string&,
                                                                 const std::string& voice) override {
        for (const auto& f : fail_on) {
            if (text.find(f) != std::string::npos) {
                return core::make_unexpected(core::make_error(core::ErrorCode::Synthesis, "synthesis", "timeout"));
            }
        }
        std::string path;
        {
            std::lock_guard<std::mutex> lk(mu_);
            voices_by_text[text] = voice;
            path = (scratch_ / ("tts_" + std::to_string(counter_++) + ".wav")).string();
        }
        audio::write_wav(path, sine(seconds_per_char * text.size(), 150.0f, 24000));
        std::ifstream f(path, std::ios::binary);
        dub::AudioBytes bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return bytes;
    }

    std::string voice_for(const std::string& text_fragment) {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : voices_by_text) {
            if (kv.first.find(text_fragment) != std::string::npos) return kv.second;
        }
        return {};
    }

    std::map<std::string, std::string> voices_by_text;

private:
    std::filesystem::path scratch_;
    std::mutex mu_;
    int counter_ = 0;
};

}
