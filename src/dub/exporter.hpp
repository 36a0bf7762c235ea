#pragma once
#include <string>
#include <utility>
#include <vector>
#include "audio/audio_tool_runner.hpp"
#include "dub/segment.hpp"

namespace dub {

struct CaptionCue {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

// "HH:MM:SS,mmm"
std::string format_srt_timestamp(double seconds);

// Numbered SRT cues separated by blank lines.
std::string render_srt(const std::vector<CaptionCue>& cues);

// One cue per translated chunk; the segment span is shared out in
// proportion to chunk length, the last cue ending exactly at seg.end.
std::vector<CaptionCue> cues_for_segment(const Segment& seg, const std::vector<std::string>& chunks);

struct ExportSettings {
    std::string output_dir = "output";
    std::string format = "wav";   // wav | m4a
    bool captions = false;
    bool archive = false;
    audio::EncodeOptions encode;
};

struct ExportedFiles {
    std::string full_mix;
    std::string voice_only;
    std::string captions;   // empty when disabled
    std::string archive;    // empty when disabled or failed
};

class Exporter {
public:
    Exporter(audio::AudioToolRunner& runner, ExportSettings settings) : runner_(runner), settings_(std::move(settings)) {}

    // Writes <output_dir>/<job>/<lang>/<job>-<lang>-{full_mix,voice_only}.<ext>,
    // optional captions and bundle. Throws core::ToolError when an audio file
    // cannot be produced.
    ExportedFiles export_language(const std::string& job_id, const std::string& language,
                                  const std::string& voice_track, const std::string& mixed_track,
                                  const std::vector<CaptionCue>& cues);

private:
    std::string write_audio(const std::string& src, const std::string& dst_no_ext);

    audio::AudioToolRunner& runner_;
    ExportSettings settings_;
};

}
