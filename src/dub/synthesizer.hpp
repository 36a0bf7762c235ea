#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/expected.hpp"

namespace dub {

// Encoded audio as returned by a speech service (any container ffmpeg can decode).
using AudioBytes = std::vector<std::uint8_t>;

class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    // Errors carry ErrorCode::Synthesis.
    virtual core::Expected<AudioBytes, core::Error> generate_speech(
        const std::string& text, const std::string& target_language, const std::string& voice_id) = 0;
};

}
