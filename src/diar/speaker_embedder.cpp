#include "diar/speaker_embedder.hpp"
#include "core/logging.hpp"
#include <onnxruntime_cxx_api.h>
#include <cmath>
#include <stdexcept>

namespace diar {

namespace {

FbankExtractor::Config fbank_config(int sample_rate) {
    FbankExtractor::Config c;
    c.sample_rate = sample_rate;
    c.frame_length = sample_rate / 40;   // 25 ms
    c.frame_shift = sample_rate / 100;   // 10 ms
    c.n_fft = 512;
    while (c.n_fft < c.frame_length) c.n_fft <<= 1;
    c.n_mels = 80;
    return c;
}

} // namespace

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        na += a[i] * a[i];
        nb += b[i] * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb) + 1e-8));
}

SpeakerEmbedder::SpeakerEmbedder(const Config& config)
    : m_config(config), m_fbank(fbank_config(config.sample_rate)) {
    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "dubline-speaker");
        m_session_options = std::make_unique<Ort::SessionOptions>();
        m_session_options->SetIntraOpNumThreads(m_config.threads);
        m_session_options->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), *m_session_options);

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_session->GetInputCount() == 0 || m_session->GetOutputCount() == 0) {
            throw std::runtime_error("speaker model has no inputs or outputs");
        }
        m_input_name = m_session->GetInputNameAllocated(0, allocator).get();
        m_output_name = m_session->GetOutputNameAllocated(0, allocator).get();

        auto shape = m_session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) m_embedding_dim = static_cast<int>(shape[1]);

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("failed to load speaker model: ") + e.what());
    }
    core::log_debug("[embed] loaded " + m_config.model_path + " (dim " + std::to_string(m_embedding_dim) + ")");
}

SpeakerEmbedder::~SpeakerEmbedder() = default;

std::vector<float> SpeakerEmbedder::embed(const float* samples, size_t n) {
    const size_t cap = static_cast<size_t>(m_config.max_seconds * m_config.sample_rate);
    if (n > cap) n = cap;
    std::vector<float> feats = m_fbank.compute(samples, n);
    const int frames = m_fbank.num_frames(n);
    if (feats.empty() || frames <= 0) return {};

    try {
        std::vector<int64_t> shape = {1, frames, m_fbank.n_mels()};
        Ort::Value input = Ort::Value::CreateTensor<float>(*m_memory_info, feats.data(), feats.size(),
                                                           shape.data(), shape.size());
        const char* in_names[] = {m_input_name.c_str()};
        const char* out_names[] = {m_output_name.c_str()};
        auto outputs = m_session->Run(Ort::RunOptions{nullptr}, in_names, &input, 1, out_names, 1);

        const float* data = outputs[0].GetTensorData<float>();
        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const size_t dim = static_cast<size_t>(out_shape.size() >= 2 ? out_shape[1] : out_shape[0]);
        std::vector<float> emb(data, data + dim);

        if (m_config.l2_normalize) {
            double norm = 0.0;
            for (float v : emb) norm += v * v;
            norm = std::sqrt(norm);
            if (norm > 1e-8) {
                for (float& v : emb) v = static_cast<float>(v / norm);
            }
        }
        return emb;
    } catch (const Ort::Exception& e) {
        core::log_warn(std::string("[embed] inference failed: ") + e.what());
        return {};
    }
}

} // namespace diar
