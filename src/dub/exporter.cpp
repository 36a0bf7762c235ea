#include "dub/exporter.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dub {

namespace fs = std::filesystem;

std::string format_srt_timestamp(double seconds) {
    const long long ms = std::llround(std::max(0.0, seconds) * 1000.0);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld",
                  ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60, ms % 1000);
    return buf;
}

std::string render_srt(const std::vector<CaptionCue>& cues) {
    std::ostringstream out;
    int n = 0;
    for (const auto& c : cues) {
        if (c.text.empty()) continue;
        if (n > 0) out << "\n";
        out << ++n << "\n"
            << format_srt_timestamp(c.start) << " --> " << format_srt_timestamp(c.end) << "\n"
            << c.text << "\n";
    }
    return out.str();
}

std::vector<CaptionCue> cues_for_segment(const Segment& seg, const std::vector<std::string>& chunks) {
    std::vector<CaptionCue> out;
    size_t total_chars = 0;
    for (const auto& c : chunks) total_chars += c.size();
    if (seg.is_silence || total_chars == 0) return out;

    double t = seg.start;
    size_t consumed = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].empty()) continue;
        consumed += chunks[i].size();
        CaptionCue cue;
        cue.start = t;
        cue.end = consumed == total_chars ? seg.end
                                          : seg.start + seg.duration * static_cast<double>(consumed) / total_chars;
        cue.text = chunks[i];
        t = cue.end;
        out.push_back(std::move(cue));
    }
    return out;
}

std::string Exporter::write_audio(const std::string& src, const std::string& dst_no_ext) {
    if (settings_.format == "m4a") {
        auto r = runner_.encode(src, dst_no_ext + ".m4a", settings_.encode);
        if (!r) throw core::ToolError("encoding failed: " + r.error().message);
        return r.value();
    }
    const std::string dst = dst_no_ext + ".wav";
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) throw core::ToolError("could not write " + fs::path(dst).filename().string());
    return dst;
}

ExportedFiles Exporter::export_language(const std::string& job_id, const std::string& language,
                                        const std::string& voice_track, const std::string& mixed_track,
                                        const std::vector<CaptionCue>& cues) {
    const fs::path job_dir = fs::path(settings_.output_dir) / job_id;
    const fs::path lang_dir = job_dir / language;
    std::error_code ec;
    fs::create_directories(lang_dir, ec);
    if (ec) throw core::ToolError("could not create output directory for " + language);

    const std::string prefix = job_id + "-" + language;
    ExportedFiles files;
    files.full_mix = write_audio(mixed_track, (lang_dir / (prefix + "-full_mix")).string());
    files.voice_only = write_audio(voice_track, (lang_dir / (prefix + "-voice_only")).string());

    if (settings_.captions) {
        files.captions = (lang_dir / (prefix + "-captions.srt")).string();
        std::ofstream f(files.captions, std::ios::binary);
        f << render_srt(cues);
        if (!f) throw core::ToolError("could not write captions for " + language);
    }

    if (settings_.archive) {
        std::vector<std::string> members = {files.full_mix, files.voice_only};
        if (!files.captions.empty()) members.push_back(files.captions);
        const std::string zip = (job_dir / (prefix + "-bundle.zip")).string();
        auto r = runner_.archive(members, zip);
        if (r) {
            files.archive = r.value();
        } else {
            core::log_warn("[export] " + language + " bundle skipped: " + r.error().message);
        }
    }

    core::log_info("[export] " + language + " -> " + lang_dir.string());
    return files;
}

}
