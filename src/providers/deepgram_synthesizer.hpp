#pragma once
#include <string>
#include <utility>
#include "dub/synthesizer.hpp"
#include "providers/http_client.hpp"

namespace providers {

// Speak endpoint URL with model and encoding query parameters.
std::string speak_url(const std::string& base, const std::string& voice_id);

class DeepgramSynthesizer : public dub::Synthesizer {
public:
    struct Options {
        std::string url = "https://api.deepgram.com/v1/speak";
        std::string api_key;
        std::string fallback_voice = "aura-asteria-en";
        int timeout_ms = 60000;
    };

    DeepgramSynthesizer(HttpClient& http, Options opts) : http_(http), opts_(std::move(opts)) {}

    core::Expected<dub::AudioBytes, core::Error> generate_speech(
        const std::string& text, const std::string& target_language, const std::string& voice_id) override;

private:
    HttpClient& http_;
    Options opts_;
};

}
