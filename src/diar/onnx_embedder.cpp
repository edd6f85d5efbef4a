#include "diar/onnx_embedder.hpp"
#include "diar/mel_features.hpp"
#include "core/logging.hpp"
#include <onnxruntime_cxx_api.h>
#include <cmath>
#include <stdexcept>

namespace diar {

struct OnnxSpeakerEmbedder::Impl {
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "SpeakerEmbedding"};
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    Ort::AllocatorWithDefaultOptions allocator;
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    // Backing storage for the name pointers handed to Run()
    std::string input_name;
    std::string output_name;
    int embedding_dim = 256;

    std::unique_ptr<MelFeatureExtractor> mel;
};

namespace {
void normalize_embedding(std::vector<float>& emb) {
    double norm = 0.0;
    for (float v : emb) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 1e-8) {
        for (float& v : emb) v = static_cast<float>(v / norm);
    }
}
} // namespace

OnnxSpeakerEmbedder::OnnxSpeakerEmbedder(const Config& config)
    : m_impl(std::make_unique<Impl>()), m_config(config)
{
    core::log_debug("[embedder] loading " + m_config.model_path);
    try {
        m_impl->session_options.SetIntraOpNumThreads(m_config.n_threads);
        m_impl->session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        m_impl->session = std::make_unique<Ort::Session>(m_impl->env, m_config.model_path.c_str(),
                                                         m_impl->session_options);

        if (m_impl->session->GetInputCount() == 0 || m_impl->session->GetOutputCount() == 0) {
            throw std::runtime_error("model has no inputs or outputs");
        }
        m_impl->input_name = m_impl->session->GetInputNameAllocated(0, m_impl->allocator).get();
        m_impl->output_name = m_impl->session->GetOutputNameAllocated(0, m_impl->allocator).get();

        auto shape = m_impl->session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) {
            m_impl->embedding_dim = static_cast<int>(shape[1]);  // (batch, embedding_dim)
        }
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("Failed to initialize ONNX embedder: ") + e.what());
    }

    MelFeatureExtractor::Config mel_config;
    mel_config.sample_rate = m_config.sample_rate;
    mel_config.n_fft = m_config.sample_rate / 40;       // 25ms
    mel_config.hop_length = m_config.sample_rate / 100; // 10ms
    mel_config.n_mels = 80;
    mel_config.fmax = m_config.sample_rate / 2.0f;
    m_impl->mel = std::make_unique<MelFeatureExtractor>(mel_config);

    core::log_info("[embedder] model loaded: in=" + m_impl->input_name + " out=" + m_impl->output_name +
                   " dim=" + std::to_string(m_impl->embedding_dim));
}

OnnxSpeakerEmbedder::~OnnxSpeakerEmbedder() = default;

int OnnxSpeakerEmbedder::embedding_dim() const { return m_impl->embedding_dim; }

std::vector<float> OnnxSpeakerEmbedder::compute_embedding(const int16_t* pcm16, size_t samples) {
    if (!pcm16 || samples == 0) return {};

    std::vector<float> audio(samples);
    for (size_t i = 0; i < samples; ++i) audio[i] = pcm16[i] / 32768.0f;

    const int n_frames = m_impl->mel->get_num_frames(static_cast<int>(audio.size()));
    if (n_frames <= 0) {
        core::log_debug("[embedder] window too short for Fbank extraction");
        return {};
    }
    std::vector<float> features = m_impl->mel->extract_features(audio.data(), static_cast<int>(audio.size()));

    try {
        // [batch=1, time_frames, n_mels]
        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(n_frames), m_impl->mel->n_mels()};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            m_impl->memory_info, features.data(), features.size(), input_shape.data(), input_shape.size());

        const char* input_names[] = {m_impl->input_name.c_str()};
        const char* output_names[] = {m_impl->output_name.c_str()};
        auto outputs = m_impl->session->Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1, output_names, 1);

        const float* data = outputs[0].GetTensorData<float>();
        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const size_t dim = static_cast<size_t>(out_shape.size() >= 2 ? out_shape[1] : out_shape[0]);
        std::vector<float> embedding(data, data + dim);

        if (m_config.normalize_output) normalize_embedding(embedding);
        return embedding;
    } catch (const Ort::Exception& e) {
        core::log_warn(std::string("[embedder] inference error: ") + e.what());
        return {};
    }
}

} // namespace diar
