#pragma once
#include <map>
#include <vector>
#include "asr/transcriber.hpp"
#include "audio/pcm_buffer.hpp"
#include "diar/voice_assigner.hpp"

namespace dub {

// Longest utterance per speaker that is strictly longer than `min_duration`.
// Speakers with only shorter utterances are absent from the result.
std::map<int, asr::Utterance> select_speaker_samples(const std::vector<asr::Utterance>& utterances,
                                                     double min_duration);

// Cuts each sample from `voice` and estimates its pitch (0.0 when unvoiced).
// Profiles are in ascending speaker id, so equal pitches rank the lower id first.
std::vector<diar::SpeakerProfile> estimate_speaker_profiles(const audio::PcmBuffer& voice,
                                                            const std::vector<asr::Utterance>& utterances,
                                                            double min_duration);

}
