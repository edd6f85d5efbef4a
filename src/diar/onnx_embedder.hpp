#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace diar {

/**
 * ONNX-based neural speaker embedding extractor.
 * Runs a pretrained Fbank-input model (WeSpeaker ResNet34, ECAPA-TDNN exports)
 * and returns one embedding per audio window.
 *
 * Only built when onnxruntime is found; OnnxDiarizer reports itself unavailable otherwise.
 */
class OnnxSpeakerEmbedder {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        int n_threads = 4;
        bool normalize_output = true;       // L2-normalize embeddings
    };

    // Throws std::runtime_error when the model cannot be loaded
    explicit OnnxSpeakerEmbedder(const Config& config);
    ~OnnxSpeakerEmbedder();

    OnnxSpeakerEmbedder(const OnnxSpeakerEmbedder&) = delete;
    OnnxSpeakerEmbedder& operator=(const OnnxSpeakerEmbedder&) = delete;

    /**
     * @param pcm16 Mono PCM16 at config.sample_rate
     * @return Embedding, or empty when the window is too short or inference failed
     */
    std::vector<float> compute_embedding(const int16_t* pcm16, size_t samples);

    int embedding_dim() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    Config m_config;
};

} // namespace diar
