#include "diar/speaker_clusterer.hpp"
#include "diar/speaker_embedder.hpp"
#include "core/logging.hpp"
#include <map>

namespace diar {

int SpeakerClusterer::assign(const std::vector<float>& emb) {
    if (emb.empty()) return m_last >= 0 ? m_last : 0;

    if (m_centroids.empty()) {
        m_centroids.push_back(emb);
        m_counts.push_back(1);
        m_last = 0;
        return 0;
    }

    int best = 0;
    float best_sim = -2.0f;
    for (size_t i = 0; i < m_centroids.size(); ++i) {
        const float sim = cosine_similarity(emb, m_centroids[i]);
        if (sim > best_sim) {
            best_sim = sim;
            best = static_cast<int>(i);
        }
    }

    if (best_sim < m_thr && static_cast<int>(m_centroids.size()) < m_max) {
        m_centroids.push_back(emb);
        m_counts.push_back(1);
        m_last = static_cast<int>(m_centroids.size()) - 1;
        core::log_debug("[cluster] new speaker " + std::to_string(m_last) + " (best sim " + std::to_string(best_sim) + ")");
        return m_last;
    }

    // Running mean keeps early frames from dominating the centroid.
    auto& c = m_centroids[best];
    const float n = static_cast<float>(++m_counts[best]);
    if (c.size() == emb.size()) {
        for (size_t i = 0; i < c.size(); ++i) c[i] += (emb[i] - c[i]) / n;
    }
    m_last = best;
    return best;
}

int SpeakerClusterer::majority(const std::vector<int>& ids, int fallback) {
    std::map<int, int> votes;
    for (int id : ids) {
        if (id >= 0) ++votes[id];
    }
    int best = fallback;
    int best_votes = 0;
    for (const auto& kv : votes) {
        if (kv.second > best_votes) {
            best = kv.first;
            best_votes = kv.second;
        }
    }
    return best;
}

} // namespace diar
