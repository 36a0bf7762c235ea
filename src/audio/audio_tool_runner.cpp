#include "audio/audio_tool_runner.hpp"
#include "core/logging.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <filesystem>
#include <sstream>

namespace audio {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

namespace {

// Trims tool stderr to its last line so error messages stay short.
std::string last_line(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    size_t start = s.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return s.substr(start, end - start + 1);
}

double json_number(const QJsonValue& v) {
    // ffprobe reports most numbers as strings
    if (v.isString()) return v.toString().toDouble();
    return v.toDouble();
}

std::string tempo_filter(double tempo) {
    std::ostringstream os;
    os.precision(6);
    os << std::fixed << "atempo=" << tempo;
    return os.str();
}

} // namespace

core::Expected<MediaInfo, core::Error> parse_ffprobe_json(const std::string& json) {
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, "probe", "invalid ffprobe output"));
    }
    const QJsonObject root = doc.object();
    const QJsonObject format = root.value("format").toObject();
    const QJsonArray streams = root.value("streams").toArray();

    MediaInfo info;
    info.duration_seconds = json_number(format.value("duration"));
    info.format = format.value("format_name").toString("unknown").section(',', 0, 0).toStdString();

    bool audio_seen = false;
    for (const QJsonValue& sv : streams) {
        const QJsonObject s = sv.toObject();
        const QString type = s.value("codec_type").toString();
        if (type == "audio" && !audio_seen) {
            audio_seen = true;
            info.has_audio = true;
            info.codec = s.value("codec_name").toString("unknown").toStdString();
            info.sample_rate = static_cast<int>(json_number(s.value("sample_rate")));
            info.channels = s.value("channels").toInt();
            if (info.duration_seconds <= 0.0) {
                info.duration_seconds = json_number(s.value("duration"));
            }
        } else if (type == "video") {
            // cover art in audio files is reported as a video stream too
            if (!s.value("disposition").toObject().value("attached_pic").toInt()) {
                info.has_video = true;
            }
        }
    }
    return info;
}

FfmpegToolRunner::FfmpegToolRunner(ToolTimeouts timeouts, std::string ffmpeg, std::string ffprobe, std::string zip)
    : timeouts_(timeouts), ffmpeg_(std::move(ffmpeg)), ffprobe_(std::move(ffprobe)), zip_(std::move(zip)) {}

FfmpegToolRunner::RunResult FfmpegToolRunner::run(const std::string& program,
                                                  const std::vector<std::string>& args,
                                                  int timeout_ms) {
    RunResult r;
    QStringList qargs;
    for (const auto& a : args) qargs << QString::fromStdString(a);

    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.start(QString::fromStdString(program), qargs);
    if (!proc.waitForStarted(10000)) {
        r.err = program + " could not be started";
        return r;
    }
    r.started = true;
    if (!proc.waitForFinished(timeout_ms)) {
        r.timed_out = true;
        proc.kill();
        proc.waitForFinished(5000);
        return r;
    }
    r.exit_code = (proc.exitStatus() == QProcess::NormalExit) ? proc.exitCode() : -1;
    r.out = proc.readAllStandardOutput().toStdString();
    r.err = proc.readAllStandardError().toStdString();
    return r;
}

core::Expected<MediaInfo, core::Error> FfmpegToolRunner::probe(const std::string& path) {
    RunResult r = run(ffprobe_, {"-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", path},
                      timeouts_.probe_ms);
    if (r.timed_out) {
        core::log_error("[ffprobe] timeout after " + std::to_string(timeouts_.probe_ms) + " ms");
        return make_unexpected(make_error(ErrorCode::ProbeTimeout, "probe", "media probing timed out"));
    }
    if (!r.started || r.exit_code != 0) {
        core::log_error("[ffprobe] failed (exit " + std::to_string(r.exit_code) + "): " + last_line(r.err));
        return make_unexpected(make_error(ErrorCode::UnsupportedFormat, "probe", "media file could not be read"));
    }
    return parse_ffprobe_json(r.out);
}

core::Expected<std::string, core::Error> FfmpegToolRunner::run_ffmpeg(
    const std::vector<std::string>& args, const std::string& out_path, int timeout_ms, const char* stage,
    core::ErrorCode timeout_code) {
    std::vector<std::string> full = {"-hide_banner", "-loglevel", "error", "-y"};
    full.insert(full.end(), args.begin(), args.end());
    full.push_back(out_path);

    core::log_debug(std::string("[ffmpeg] ") + stage + " -> " + out_path);
    RunResult r = run(ffmpeg_, full, timeout_ms);
    if (r.timed_out) {
        core::log_error(std::string("[ffmpeg] ") + stage + " timed out");
        return make_unexpected(make_error(timeout_code, stage, "audio tool timed out"));
    }
    if (!r.started || r.exit_code != 0) {
        core::log_error(std::string("[ffmpeg] ") + stage + " failed (exit " + std::to_string(r.exit_code) +
                        "): " + last_line(r.err));
        return make_unexpected(make_error(ErrorCode::ToolFailure, stage, "audio tool failed"));
    }
    if (!std::filesystem::exists(out_path)) {
        return make_unexpected(make_error(ErrorCode::ToolFailure, stage, "audio tool produced no output"));
    }
    return out_path;
}

core::Expected<std::string, core::Error> FfmpegToolRunner::extract_audio(
    const std::string& video_path, const std::string& out_path, ExtractFormat format) {
    std::vector<std::string> args = {"-i", video_path, "-vn"};
    switch (format) {
    case ExtractFormat::Wav:
        args.insert(args.end(), {"-acodec", "pcm_s16le", "-ar", "44100"});
        break;
    case ExtractFormat::Mp3:
        args.insert(args.end(), {"-acodec", "libmp3lame", "-q:a", "2"});
        break;
    case ExtractFormat::Copy:
        args.insert(args.end(), {"-acodec", "copy"});
        break;
    }
    // a hung extraction surfaces as ProbeTimeoutError from MediaProbe
    return run_ffmpeg(args, out_path, timeouts_.extract_ms, "extract", ErrorCode::ProbeTimeout);
}

core::Expected<std::string, core::Error> FfmpegToolRunner::normalize(
    const std::string& in_path, const std::string& out_wav, int sample_rate, int channels) {
    return run_ffmpeg({"-i", in_path, "-vn", "-ar", std::to_string(sample_rate), "-ac", std::to_string(channels),
                       "-c:a", "pcm_s16le"},
                      out_wav, timeouts_.default_ms, "normalize");
}

core::Expected<std::string, core::Error> FfmpegToolRunner::time_stretch(
    const std::string& in_wav, const std::string& out_wav, double tempo) {
    return run_ffmpeg({"-i", in_wav, "-filter:a", tempo_filter(tempo), "-c:a", "pcm_s16le"},
                      out_wav, timeouts_.default_ms, "stretch");
}

core::Expected<std::string, core::Error> FfmpegToolRunner::encode(
    const std::string& in_wav, const std::string& out_path, const EncodeOptions& opts) {
    return run_ffmpeg({"-i", in_wav, "-c:a", opts.codec, "-b:a", opts.bitrate, "-ar", std::to_string(opts.sample_rate),
                       "-ac", std::to_string(opts.channels)},
                      out_path, timeouts_.default_ms, "encode");
}

core::Expected<std::string, core::Error> FfmpegToolRunner::archive(
    const std::vector<std::string>& files, const std::string& zip_path) {
    std::vector<std::string> args = {"-j", "-q", zip_path};
    args.insert(args.end(), files.begin(), files.end());
    RunResult r = run(zip_, args, timeouts_.default_ms);
    if (r.timed_out || !r.started || r.exit_code != 0) {
        core::log_error("[zip] archive failed: " + last_line(r.err));
        return make_unexpected(make_error(ErrorCode::ToolFailure, "export", "archive could not be created"));
    }
    return zip_path;
}

}
