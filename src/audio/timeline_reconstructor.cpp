#include "audio/timeline_reconstructor.hpp"
#include "audio/pcm_buffer.hpp"
#include "audio/wav_io.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace audio {

std::string TimelineReconstructor::reconstruct(const std::vector<ProcessedSegmentAudio>& segments,
                                               const std::string& out_wav,
                                               double expected_total) const {
    std::vector<ProcessedSegmentAudio> ordered = segments;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ProcessedSegmentAudio& a, const ProcessedSegmentAudio& b) {
                         return a.segment_index < b.segment_index;
                     });

    PcmBuffer track;
    track.sample_rate = sample_rate_;
    track.channels = 1;

    for (const auto& seg : ordered) {
        if (!std::filesystem::exists(seg.file_path)) {
            throw core::ReconstructionError("segment " + std::to_string(seg.segment_index) + " audio is missing");
        }
        PcmBuffer part;
        if (!read_wav(seg.file_path, part)) {
            throw core::ReconstructionError("segment " + std::to_string(seg.segment_index) + " audio is unreadable");
        }
        if (part.channels != 1) part = downmix_to_mono(part);
        if (!append(track, part)) {
            throw core::ReconstructionError("segment " + std::to_string(seg.segment_index) +
                                            " has sample rate " + std::to_string(part.sample_rate) +
                                            ", expected " + std::to_string(sample_rate_));
        }
    }

    if (!write_wav(out_wav, track)) {
        throw core::ReconstructionError("could not write reconstructed track");
    }

    const double total = track.duration_seconds();
    if (expected_total >= 0.0) {
        const double bound = 0.05 * std::max<size_t>(1, ordered.size());
        const double drift = std::fabs(total - expected_total);
        if (drift > bound) {
            core::log_warn("[reconstruct] track is " + std::to_string(total) + "s, expected " +
                           std::to_string(expected_total) + "s");
        } else if (drift > 0.01) {
            core::log_debug("[reconstruct] drift " + std::to_string(drift) + "s over " +
                            std::to_string(ordered.size()) + " segments");
        }
    }
    core::log_info("[reconstruct] " + std::to_string(ordered.size()) + " segments, " + std::to_string(total) + "s");
    return out_wav;
}

}
