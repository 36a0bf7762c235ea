#pragma once
#include <map>
#include <string>
#include <vector>
#include "diar/voice_catalog.hpp"

namespace diar {

struct SpeakerProfile {
    int speaker_id = 0;
    float estimated_pitch_hz = 0.0f;
};

struct VoiceAssignment {
    std::map<int, std::string> by_speaker;
    std::string default_voice;

    // Assigned voice, or the default for speakers that had no usable sample.
    const std::string& voice_for(int speaker_id) const;
};

// Rank matching: speakers sorted by pitch (ties keep input order) are zipped with
// the catalog sorted by pitch, speaker i taking voice (i mod catalog size).
// This is not nearest-pitch matching.
VoiceAssignment assign_voices(const std::vector<SpeakerProfile>& speakers, const LanguageVoices& catalog);

}
