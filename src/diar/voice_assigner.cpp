#include "diar/voice_assigner.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cstdio>

namespace diar {

const std::string& VoiceAssignment::voice_for(int speaker_id) const {
    auto it = by_speaker.find(speaker_id);
    return it != by_speaker.end() ? it->second : default_voice;
}

VoiceAssignment assign_voices(const std::vector<SpeakerProfile>& speakers, const LanguageVoices& catalog) {
    VoiceAssignment out;
    out.default_voice = catalog.default_voice;
    if (catalog.voices.empty()) return out;

    std::vector<SpeakerProfile> sorted_speakers = speakers;
    std::stable_sort(sorted_speakers.begin(), sorted_speakers.end(),
                     [](const SpeakerProfile& a, const SpeakerProfile& b) {
                         return a.estimated_pitch_hz < b.estimated_pitch_hz;
                     });
    std::vector<VoiceCatalogEntry> sorted_voices = catalog.voices;
    std::stable_sort(sorted_voices.begin(), sorted_voices.end(),
                     [](const VoiceCatalogEntry& a, const VoiceCatalogEntry& b) { return a.pitch_hz < b.pitch_hz; });

    for (size_t i = 0; i < sorted_speakers.size(); ++i) {
        const auto& voice = sorted_voices[i % sorted_voices.size()];
        out.by_speaker[sorted_speakers[i].speaker_id] = voice.voice_name;
        char line[160];
        std::snprintf(line, sizeof(line), "[voices] speaker %d (%.1f Hz) -> %s (%.0f Hz)",
                      sorted_speakers[i].speaker_id, sorted_speakers[i].estimated_pitch_hz,
                      voice.voice_name.c_str(), voice.pitch_hz);
        core::log_info(line);
    }
    return out;
}

}
