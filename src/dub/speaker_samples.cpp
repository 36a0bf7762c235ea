#include "dub/speaker_samples.hpp"
#include "core/logging.hpp"
#include "diar/pitch_estimator.hpp"
#include <cstdio>
#include <set>

namespace dub {

std::map<int, asr::Utterance> select_speaker_samples(const std::vector<asr::Utterance>& utterances,
                                                     double min_duration) {
    std::map<int, asr::Utterance> best;
    for (const auto& u : utterances) {
        const double d = u.end - u.start;
        if (d <= min_duration) continue;
        auto it = best.find(u.speaker_id);
        if (it == best.end() || d > it->second.end - it->second.start) best[u.speaker_id] = u;
    }
    return best;
}

std::vector<diar::SpeakerProfile> estimate_speaker_profiles(const audio::PcmBuffer& voice,
                                                            const std::vector<asr::Utterance>& utterances,
                                                            double min_duration) {
    const auto samples = select_speaker_samples(utterances, min_duration);
    const audio::PcmBuffer mono = audio::downmix_to_mono(voice);

    std::set<int> speakers;
    for (const auto& u : utterances) speakers.insert(u.speaker_id);

    std::vector<diar::SpeakerProfile> out;
    for (int id : speakers) {
        auto it = samples.find(id);
        if (it == samples.end()) {
            core::log_info("[voices] speaker " + std::to_string(id) + " has no sample over " +
                           std::to_string(min_duration) + "s; default voice");
            continue;
        }
        const audio::PcmBuffer clip = audio::slice(mono, it->second.start, it->second.end);
        diar::SpeakerProfile p;
        p.speaker_id = id;
        p.estimated_pitch_hz = diar::estimate_pitch(clip.samples.data(), clip.samples.size(), clip.sample_rate);
        char line[96];
        std::snprintf(line, sizeof(line), "[voices] speaker %d pitch %.1f Hz", p.speaker_id, p.estimated_pitch_hz);
        core::log_debug(line);
        out.push_back(p);
    }
    return out;
}

}
