#include "diar/speaker_cluster.hpp"
#include <cmath>

namespace diar {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 1e-12 || nb <= 1e-12) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

SpeakerClusterer::SpeakerClusterer() : SpeakerClusterer(Config{}) {}

SpeakerClusterer::SpeakerClusterer(const Config& config) : m_config(config) {
    if (m_config.max_speakers < 1) m_config.max_speakers = 1;
}

void SpeakerClusterer::reset() {
    m_centroids.clear();
    m_current_speaker = -1;
    m_frames_since_change = 0;
}

int SpeakerClusterer::open_speaker(const std::vector<float>& emb) {
    m_centroids.push_back(emb);
    m_current_speaker = static_cast<int>(m_centroids.size()) - 1;
    m_frames_since_change = 0;
    return m_current_speaker;
}

int SpeakerClusterer::assign(const std::vector<float>& emb) {
    if (emb.empty()) return m_current_speaker;

    if (m_centroids.empty()) {
        return open_speaker(emb);
    }

    std::vector<float> similarities(m_centroids.size());
    int best = 0;
    for (size_t i = 0; i < m_centroids.size(); ++i) {
        similarities[i] = cosine_similarity(emb, m_centroids[i]);
        if (similarities[i] > similarities[best]) best = static_cast<int>(i);
    }
    const float best_sim = similarities[best];
    const bool room = num_speakers() < m_config.max_speakers;

    if (m_current_speaker >= 0) {
        const float current_sim = similarities[m_current_speaker];

        if (current_sim >= m_config.sim_threshold) {
            auto& c = m_centroids[m_current_speaker];
            for (size_t i = 0; i < c.size() && i < emb.size(); ++i) {
                c[i] = (1.0f - m_config.centroid_rate) * c[i] + m_config.centroid_rate * emb[i];
            }
            m_frames_since_change++;
            return m_current_speaker;
        }

        const bool settled = m_frames_since_change >= m_config.min_frames_before_switch;
        if (best != m_current_speaker && best_sim > current_sim + m_config.switch_margin && settled) {
            m_current_speaker = best;
            m_frames_since_change = 0;
            return best;
        }
        if (room && best_sim < m_config.sim_threshold + m_config.new_speaker_margin && settled) {
            return open_speaker(emb);
        }

        // Marginal: stay
        m_frames_since_change++;
        return m_current_speaker;
    }

    if (best_sim >= m_config.sim_threshold || !room) {
        m_current_speaker = best;
        m_frames_since_change = 0;
        return best;
    }
    return open_speaker(emb);
}

} // namespace diar
