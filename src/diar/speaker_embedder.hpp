#pragma once

#include <memory>
#include <string>
#include <vector>
#include "diar/fbank.hpp"

// Forward declarations to keep onnxruntime headers out of the pipeline
namespace Ort {
    struct Env;
    struct Session;
    struct SessionOptions;
    struct MemoryInfo;
}

namespace diar {

/**
 * Neural speaker embedding (WeSpeaker / ECAPA style ONNX model taking
 * [1, frames, 80] Fbank input). One instance per thread; the session is
 * not shared.
 */
class SpeakerEmbedder {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        float max_seconds = 3.0f;   // longer windows are cut to this
        int threads = 2;
        bool l2_normalize = true;
    };

    // Throws std::runtime_error if the model cannot be loaded.
    explicit SpeakerEmbedder(const Config& config);
    ~SpeakerEmbedder();

    SpeakerEmbedder(const SpeakerEmbedder&) = delete;
    SpeakerEmbedder& operator=(const SpeakerEmbedder&) = delete;

    /**
     * @param samples mono float audio at config().sample_rate
     * @return embedding, or an empty vector when the window is too short or inference fails
     */
    std::vector<float> embed(const float* samples, size_t n);

    int embedding_dim() const { return m_embedding_dim; }
    const Config& config() const { return m_config; }

private:
    Config m_config;
    FbankExtractor m_fbank;

    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::SessionOptions> m_session_options;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;

    std::string m_input_name;
    std::string m_output_name;
    int m_embedding_dim = 256;
};

// Cosine similarity; 0 for empty or mismatched vectors.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace diar
