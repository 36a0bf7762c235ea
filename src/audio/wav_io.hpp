#pragma once
#include <string>
#include "audio/pcm_buffer.hpp"

namespace audio {

// Reads any PCM/float WAV dr_wav understands. Returns false if the file cannot be decoded.
bool read_wav(const std::string& path, PcmBuffer& out);

// Writes 16-bit PCM WAV at the buffer's rate/channels. Samples are clamped to [-1, 1].
bool write_wav(const std::string& path, const PcmBuffer& buf);

// Frame count / rate from the header only. Returns a negative value on failure.
double wav_duration_seconds(const std::string& path);

}
