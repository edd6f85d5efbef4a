#include "core/recognition_worker.hpp"
#include "core/logging.hpp"
#include "core/text_utils.hpp"

#include <chrono>
#include <numeric>
#include <sstream>

namespace core {

namespace {
const char* const kFillers[] = {"um", "uh", "ah", "hmm", "er", "mm"};

std::string fmt2(double v) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(2);
    os << v;
    return os.str();
}
} // namespace

RecognitionWorker::RecognitionWorker(std::shared_ptr<asr::IRecognizer> recognizer,
                                     BoundedQueue<AudioChunk>& input,
                                     BoundedQueue<TranscriptSegment>& output,
                                     Config config)
    : recognizer_(std::move(recognizer)), input_(input), output_(output), config_(std::move(config)) {}

RecognitionWorker::~RecognitionWorker() {
    stop();
}

bool RecognitionWorker::start() {
    if (running_.load() || thread_.joinable()) return false;
    if (!recognizer_) {
        log_error("[worker] no recognizer");
        return false;
    }
    running_.store(true);
    thread_ = std::thread([this]() { run(); });
    return true;
}

void RecognitionWorker::stop() {
    running_.store(false);
    input_.stop();
    if (thread_.joinable()) thread_.join();
}

void RecognitionWorker::join() {
    if (thread_.joinable()) thread_.join();
}

RecognitionWorker::Stats RecognitionWorker::stats() const {
    Stats s;
    s.processed = processed_.load();
    s.accepted = accepted_.load();
    s.filtered = filtered_.load();
    s.failed = failed_.load();
    s.dropped = input_.dropped_count();
    s.average_rtf = average_rtf_.load();
    s.slow_warnings = slow_warnings_.load();
    s.falling_behind = slow_warned_.load();
    s.input_queue_size = input_.size();
    s.output_queue_size = output_.size();
    return s;
}

bool RecognitionWorker::is_filler_only(const std::string& text) {
    for (const auto& token : tokenize_words(text)) {
        bool filler = false;
        for (const char* f : kFillers) {
            if (token == f) {
                filler = true;
                break;
            }
        }
        if (!filler) return false;
    }
    return true;
}

double RecognitionWorker::mean_square_energy(const std::vector<int16_t>& samples) {
    if (samples.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : samples) {
        const double v = s / 32768.0;
        sum += v * v;
    }
    return sum / static_cast<double>(samples.size());
}

void RecognitionWorker::run() {
    log_debug("[worker] started with " + recognizer_->name());
    while (running_.load()) {
        AudioChunk chunk;
        if (!input_.pop(chunk)) {
            break;  // stopped and drained
        }
        if (!running_.load()) break;
        processed_++;
        process(chunk);
    }
    running_.store(false);
    log_debug("[worker] exiting after " + std::to_string(processed_.load()) + " chunks");
}

void RecognitionWorker::process(const AudioChunk& chunk) {
    const double duration = chunk.duration_s();
    if (duration < config_.min_chunk_seconds || mean_square_energy(chunk.samples) < config_.min_energy) {
        filtered_++;
        return;
    }

    const auto t0 = std::chrono::steady_clock::now();
    Result<asr::RecognitionResult> result = asr::RecognitionResult{};
    try {
        result = recognizer_->recognize(chunk.samples.data(), chunk.samples.size(), chunk.sample_rate,
                                        config_.language);
    } catch (const std::exception& e) {
        failed_++;
        log_warn("[worker] chunk " + std::to_string(chunk.index) + " threw: " + e.what());
        return;
    }
    const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    record_rtf(wall > 0.0 ? duration / wall : 1e6);

    if (!result.ok()) {
        failed_++;
        log_warn("[worker] chunk " + std::to_string(chunk.index) + " failed: " + result.error().describe());
        return;
    }

    const std::string text = trim(result.value().text);
    if (text.size() < config_.min_text_chars || is_filler_only(text)) {
        filtered_++;
        return;
    }
    const std::string normalized = to_lower(text);
    if (is_repeat(normalized)) {
        filtered_++;
        log_debug("[worker] dropped repeat: " + text);
        return;
    }
    recent_texts_.push_back(normalized);
    while (recent_texts_.size() > config_.dedup_window) recent_texts_.pop_front();

    TranscriptSegment seg;
    seg.text = text;
    seg.start = chunk.start_time;
    seg.end = chunk.start_time + duration;
    seg.confidence = result.value().confidence();
    accepted_++;

    if (config_.on_segment) {
        try {
            config_.on_segment(seg);
        } catch (const std::exception& e) {
            log_error(std::string("[worker] segment callback threw: ") + e.what());
        }
    }
    output_.push(std::move(seg));
}

bool RecognitionWorker::is_repeat(const std::string& normalized) const {
    for (const auto& t : recent_texts_) {
        if (t == normalized) return true;
    }
    return false;
}

void RecognitionWorker::record_rtf(double rtf) {
    rtf_samples_++;
    const double prev = average_rtf_.load();
    average_rtf_.store(prev + (rtf - prev) / static_cast<double>(rtf_samples_));

    recent_rtf_.push_back(rtf);
    while (recent_rtf_.size() > config_.rtf_window) recent_rtf_.pop_front();
    if (recent_rtf_.size() < config_.rtf_window) return;

    const double window_avg = std::accumulate(recent_rtf_.begin(), recent_rtf_.end(), 0.0) / recent_rtf_.size();
    if (window_avg < 1.0 && !slow_warned_.load()) {
        slow_warned_.store(true);
        slow_warnings_++;
        log_warn("[worker] falling behind real time: RTF " + fmt2(window_avg) + " over last " +
                 std::to_string(recent_rtf_.size()) + " chunks");
    } else if (window_avg >= 1.0 && slow_warned_.load()) {
        slow_warned_.store(false);
        log_info("[worker] back to real time: RTF " + fmt2(window_avg));
    }
}

} // namespace core
