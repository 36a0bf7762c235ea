#pragma once
#include <vector>

namespace diar {

// Online cosine clustering of speaker embeddings for one recording.
class SpeakerClusterer {
public:
    explicit SpeakerClusterer(int max_speakers = 2, float sim_threshold = 0.55f)
        : m_max(max_speakers), m_thr(sim_threshold) {}

    // Returns the 0-based speaker id for `emb`. A new speaker is opened when no
    // centroid reaches the threshold and the speaker limit allows it; otherwise
    // the closest centroid wins. An empty embedding returns the last speaker (or 0).
    int assign(const std::vector<float>& emb);

    // Majority vote over per-window ids; ties go to the lowest id. -1 votes are ignored.
    static int majority(const std::vector<int>& ids, int fallback);

    int num_speakers() const { return static_cast<int>(m_centroids.size()); }

private:
    int m_max;
    float m_thr;
    std::vector<std::vector<float>> m_centroids;
    std::vector<int> m_counts;
    int m_last = -1;
};

} // namespace diar
