#pragma once
#include <vector>

namespace diar {

// Cosine similarity in [-1, 1]; 0 for empty or mismatched vectors
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * Online speaker clustering over a stream of window embeddings.
 *
 * Each embedding goes to the closest centroid by cosine similarity. Hysteresis
 * keeps the current speaker unless the evidence for a change is clearly stronger,
 * which avoids label flapping on short noisy windows. New clusters open only
 * while fewer than max_speakers exist.
 */
class SpeakerClusterer {
public:
    struct Config {
        int max_speakers = 2;
        float sim_threshold = 0.60f;      // Stay with the current speaker at or above this
        float switch_margin = 0.15f;      // Best must beat current by this much to switch
        float new_speaker_margin = 0.10f; // New cluster only below sim_threshold + this
        int min_frames_before_switch = 3;
        float centroid_rate = 0.05f;      // EMA weight of a new embedding
    };

    SpeakerClusterer();
    explicit SpeakerClusterer(const Config& config);

    // Returns a 0-based speaker index, or -1 for an empty embedding before any speaker exists
    int assign(const std::vector<float>& emb);

    int current_speaker() const { return m_current_speaker; }
    int num_speakers() const { return static_cast<int>(m_centroids.size()); }
    void reset();

private:
    int open_speaker(const std::vector<float>& emb);

    Config m_config;
    std::vector<std::vector<float>> m_centroids;
    int m_current_speaker = -1;
    int m_frames_since_change = 0;
};

} // namespace diar
