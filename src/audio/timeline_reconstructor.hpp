#pragma once
#include <string>
#include <vector>

namespace audio {

struct ProcessedSegmentAudio {
    size_t segment_index = 0;
    std::string file_path;
    double actual_duration = 0.0;
};

// Joins per-segment WAVs, in segment order, into one continuous voice track.
class TimelineReconstructor {
public:
    explicit TimelineReconstructor(int sample_rate = 44100) : sample_rate_(sample_rate) {}

    // Throws core::ReconstructionError if any segment file is missing or unreadable,
    // or if segment formats disagree.
    // `expected_total` < 0 disables the duration check.
    std::string reconstruct(const std::vector<ProcessedSegmentAudio>& segments,
                            const std::string& out_wav,
                            double expected_total = -1.0) const;

private:
    int sample_rate_;
};

}
