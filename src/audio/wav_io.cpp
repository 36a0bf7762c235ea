#include "audio/wav_io.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace audio {

bool read_wav(const std::string& path, PcmBuffer& out) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return false;
    }
    const uint64_t n = wav.totalPCMFrameCount;
    out.sample_rate = static_cast<int>(wav.sampleRate);
    out.channels = static_cast<int>(wav.channels);
    out.samples.assign(static_cast<size_t>(n * wav.channels), 0.0f);
    uint64_t got = n > 0 ? drwav_read_pcm_frames_f32(&wav, n, out.samples.data()) : 0;
    drwav_uninit(&wav);
    if (got < n) {
        out.samples.resize(static_cast<size_t>(got * out.channels));
    }
    return true;
}

bool write_wav(const std::string& path, const PcmBuffer& buf) {
    if (buf.sample_rate <= 0 || buf.channels <= 0) return false;

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = static_cast<drwav_uint32>(buf.channels);
    format.sampleRate = static_cast<drwav_uint32>(buf.sample_rate);
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        return false;
    }
    std::vector<int16_t> pcm16(buf.samples.size());
    for (size_t i = 0; i < buf.samples.size(); ++i) {
        float v = std::clamp(buf.samples[i], -1.0f, 1.0f);
        pcm16[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }
    const drwav_uint64 frames = buf.frames();
    drwav_uint64 written = frames > 0 ? drwav_write_pcm_frames(&wav, frames, pcm16.data()) : 0;
    drwav_uninit(&wav);
    return written == frames;
}

double wav_duration_seconds(const std::string& path) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return -1.0;
    }
    double d = wav.sampleRate > 0 ? static_cast<double>(wav.totalPCMFrameCount) / wav.sampleRate : -1.0;
    drwav_uninit(&wav);
    return d;
}

} // namespace audio
