#include "dub/chunked_ops.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/wav_io.hpp"
#include "core/logging.hpp"
#include <filesystem>
#include <fstream>

namespace dub {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

core::Expected<std::vector<std::string>, core::Error> translate_chunked(
    Translator& translator, const std::vector<std::string>& chunks,
    const std::string& target_language, const std::string& source_language) {
    std::vector<std::string> out;
    out.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        auto r = translator.translate(chunks[i], target_language, source_language);
        if (!r) return make_unexpected(r.error());
        out.push_back(r.value());
    }
    if (chunks.size() > 1) {
        core::log_debug("[chunks] translated " + std::to_string(chunks.size()) + " chunks to " + target_language);
    }
    return out;
}

core::Expected<std::string, core::Error> synthesize_chunked(
    Synthesizer& synthesizer, audio::AudioToolRunner& runner, const std::vector<std::string>& chunks,
    const std::string& target_language, const std::string& voice_id, const SynthesisTarget& target) {
    namespace fs = std::filesystem;
    const fs::path dir(target.work_dir);

    audio::PcmBuffer speech;
    speech.sample_rate = target.sample_rate;
    speech.channels = 1;

    for (size_t i = 0; i < chunks.size(); ++i) {
        auto bytes = synthesizer.generate_speech(chunks[i], target_language, voice_id);
        if (!bytes) return make_unexpected(bytes.error());
        if (bytes.value().empty()) {
            return make_unexpected(make_error(ErrorCode::Synthesis, "synthesis", "speech service returned no audio"));
        }

        const std::string base = target.stem + ".chunk" + std::to_string(i);
        const std::string raw_path = (dir / (base + ".audio")).string();
        {
            std::ofstream f(raw_path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(bytes.value().data()),
                    static_cast<std::streamsize>(bytes.value().size()));
            if (!f) {
                return make_unexpected(make_error(ErrorCode::ToolFailure, "synthesis", "could not store synthesized audio"));
            }
        }

        const std::string wav_path = (dir / (base + ".wav")).string();
        auto norm = runner.normalize(raw_path, wav_path, target.sample_rate, 1);
        std::error_code ec;
        fs::remove(raw_path, ec);
        if (!norm) return make_unexpected(norm.error());

        audio::PcmBuffer part;
        const bool ok = audio::read_wav(norm.value(), part);
        fs::remove(wav_path, ec);
        if (!ok || !audio::append(speech, audio::downmix_to_mono(part))) {
            return make_unexpected(make_error(ErrorCode::Synthesis, "synthesis", "synthesized audio could not be decoded"));
        }
    }

    const std::string out_path = (dir / (target.stem + ".speech.wav")).string();
    if (!audio::write_wav(out_path, speech)) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, "synthesis", "could not write synthesized speech"));
    }
    return out_path;
}

}
