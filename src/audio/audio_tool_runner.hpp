#pragma once
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/expected.hpp"

namespace audio {

struct MediaInfo {
    double duration_seconds = 0.0;
    bool has_audio = false;
    bool has_video = false;
    int sample_rate = 0;
    int channels = 0;
    std::string codec = "none";
    std::string format = "unknown";
};

enum class ExtractFormat {
    Wav,  // pcm_s16le, canonical rate
    Mp3,  // libmp3lame -q:a 2
    Copy  // stream copy
};

struct EncodeOptions {
    std::string codec = "aac";
    std::string bitrate = "192k";
    int sample_rate = 44100;
    int channels = 2;
};

struct ToolTimeouts {
    int probe_ms = 30000;
    int extract_ms = 300000;
    int default_ms = 120000;
};

// Every external audio-tool invocation of the pipeline goes through this interface.
// Implementations report failures as core::Error values; they never throw.
class AudioToolRunner {
public:
    virtual ~AudioToolRunner() = default;

    virtual core::Expected<MediaInfo, core::Error> probe(const std::string& path) = 0;

    virtual core::Expected<std::string, core::Error> extract_audio(
        const std::string& video_path, const std::string& out_path, ExtractFormat format) = 0;

    // Decodes any input into a PCM16 WAV at the given rate and channel count.
    virtual core::Expected<std::string, core::Error> normalize(
        const std::string& in_path, const std::string& out_wav, int sample_rate, int channels) = 0;

    // Pitch-preserving tempo change; tempo > 1 shortens the audio by that factor.
    virtual core::Expected<std::string, core::Error> time_stretch(
        const std::string& in_wav, const std::string& out_wav, double tempo) = 0;

    virtual core::Expected<std::string, core::Error> encode(
        const std::string& in_wav, const std::string& out_path, const EncodeOptions& opts) = 0;

    // Bundles the files (flat, no directories) into a zip archive.
    virtual core::Expected<std::string, core::Error> archive(
        const std::vector<std::string>& files, const std::string& zip_path) = 0;
};

// Parses `ffprobe -print_format json -show_format -show_streams` output.
core::Expected<MediaInfo, core::Error> parse_ffprobe_json(const std::string& json);

// ffmpeg/ffprobe/zip subprocess implementation (QProcess with per-call timeouts).
class FfmpegToolRunner : public AudioToolRunner {
public:
    explicit FfmpegToolRunner(ToolTimeouts timeouts = {},
                              std::string ffmpeg = "ffmpeg",
                              std::string ffprobe = "ffprobe",
                              std::string zip = "zip");

    core::Expected<MediaInfo, core::Error> probe(const std::string& path) override;
    core::Expected<std::string, core::Error> extract_audio(
        const std::string& video_path, const std::string& out_path, ExtractFormat format) override;
    core::Expected<std::string, core::Error> normalize(
        const std::string& in_path, const std::string& out_wav, int sample_rate, int channels) override;
    core::Expected<std::string, core::Error> time_stretch(
        const std::string& in_wav, const std::string& out_wav, double tempo) override;
    core::Expected<std::string, core::Error> encode(
        const std::string& in_wav, const std::string& out_path, const EncodeOptions& opts) override;
    core::Expected<std::string, core::Error> archive(
        const std::vector<std::string>& files, const std::string& zip_path) override;

    struct RunResult {
        bool started = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string out;
        std::string err;
    };

    // Runs a program to completion (or kills it at the timeout).
    static RunResult run(const std::string& program, const std::vector<std::string>& args, int timeout_ms);

private:
    core::Expected<std::string, core::Error> run_ffmpeg(
        const std::vector<std::string>& args, const std::string& out_path,
        int timeout_ms, const char* stage, core::ErrorCode timeout_code = core::ErrorCode::ToolFailure);

    ToolTimeouts timeouts_;
    std::string ffmpeg_;
    std::string ffprobe_;
    std::string zip_;
};

}
