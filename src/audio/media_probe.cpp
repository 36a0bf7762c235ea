#include "audio/media_probe.hpp"
#include "core/logging.hpp"
#include <filesystem>
#include <sstream>

namespace audio {

namespace fs = std::filesystem;

namespace {
[[noreturn]] void rethrow(const core::Error& e) {
    switch (e.code) {
    case core::ErrorCode::MediaNotFound:     throw core::MediaNotFoundError(e.message);
    case core::ErrorCode::UnsupportedFormat: throw core::UnsupportedFormatError(e.message);
    case core::ErrorCode::ProbeTimeout:      throw core::ProbeTimeoutError(e.message);
    default:                                 throw core::PipelineError(e);
    }
}
} // namespace

MediaInfo MediaProbe::probe(const std::string& path) {
    if (!fs::exists(path)) {
        throw core::MediaNotFoundError("input media file does not exist");
    }
    auto res = runner_.probe(path);
    if (!res) rethrow(res.error());

    const MediaInfo& info = res.value();
    if (!info.has_audio) {
        throw core::UnsupportedFormatError("input has no audio stream");
    }
    std::ostringstream os;
    os.precision(2);
    os << std::fixed << "[probe] " << fs::path(path).filename().string() << ": " << info.duration_seconds << "s, "
       << info.format << ", " << info.codec << ", " << info.sample_rate << "Hz, ch=" << info.channels
       << (info.has_video ? ", video" : "");
    core::log_info(os.str());
    return info;
}

std::string MediaProbe::extract_audio_track(const std::string& video_path, const std::string& out_path,
                                            ExtractFormat format) {
    if (!fs::exists(video_path)) {
        throw core::MediaNotFoundError("video file does not exist");
    }
    core::log_info("[probe] extracting audio track from " + fs::path(video_path).filename().string());
    auto res = runner_.extract_audio(video_path, out_path, format);
    if (!res) rethrow(res.error());
    if (!fs::exists(res.value())) {
        throw core::ToolError("audio extraction produced no output");
    }
    return res.value();
}

std::string MediaProbe::prepare_canonical(const std::string& input_path, const std::string& work_dir,
                                          const std::string& stem, int sample_rate, MediaInfo& info) {
    info = probe(input_path);
    std::string source = input_path;
    if (info.has_video) {
        source = extract_audio_track(input_path, (fs::path(work_dir) / (stem + "_extracted.wav")).string(),
                                     ExtractFormat::Wav);
    }
    const std::string canonical = (fs::path(work_dir) / (stem + ".wav")).string();
    auto res = runner_.normalize(source, canonical, sample_rate, 1);
    if (!res) rethrow(res.error());
    return res.value();
}

}
