#pragma once
#include <string>
#include <vector>

namespace core {

struct Config {
    // Models
    std::string whisper_model = "base.en";                   // name under models/ or a path
    std::string speaker_model = "models/speaker_embedding.onnx";
    std::string language = "en";
    int n_threads = 0;                                       // 0 = auto

    // Audio and chunking
    int sample_rate = 16000;
    double live_chunk_seconds = 3.0;
    double file_chunk_seconds = 5.0;
    std::string ffmpeg_path = "ffmpeg";

    // Queues
    size_t chunk_queue_capacity = 10;
    size_t result_queue_capacity = 50;

    // Providers, in preference order: "scribe", "whisper+diarizer", "whisper"
    std::vector<std::string> provider_order = {"scribe", "whisper+diarizer", "whisper"};
    std::string elevenlabs_api_key;
    std::string elevenlabs_base_url = "https://api.elevenlabs.io";
    int max_speakers = 2;
    int retry_attempts = 3;

    std::string output_dir = "output";
};

// Process-wide configuration, read from the environment on first use
const Config& get_config();

// Builds a config from defaults plus STREAMSCRIBE_* / ELEVENLABS_* environment variables
Config load_config_from_env();

// Human-readable problems with the config; empty when usable
std::vector<std::string> validate(const Config& config);

} // namespace core
