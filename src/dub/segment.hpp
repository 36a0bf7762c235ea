#pragma once
#include <string>
#include <vector>

namespace dub {

// One interval of the authoritative timeline. Segments are contiguous,
// ordered and together cover [0, total duration).
struct Segment {
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
    bool is_silence = true;
    std::string text;       // non-empty for speech
    int speaker_id = -1;    // -1 for silence
    std::string voice_id;   // filled in by voice assignment
};

using Timeline = std::vector<Segment>;

}
