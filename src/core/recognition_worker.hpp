#pragma once

#include "asr/recognizer.hpp"
#include "core/bounded_queue.hpp"
#include "core/types.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace core {

/**
 * @brief Pulls audio chunks off the chunk queue and turns them into transcript segments
 *
 * Runs on its own thread. Each chunk gets one synchronous recognition call and
 * yields zero or one segment. Silent, too short, filler-only and repeated output
 * is filtered out; a failed chunk is counted and skipped.
 */
class RecognitionWorker {
public:
    using SegmentCallback = std::function<void(const TranscriptSegment&)>;

    struct Config {
        std::string language = "en";
        double min_chunk_seconds = 0.5;     ///< Shorter chunks are not recognized
        double min_energy = 1e-6;           ///< Mean square of [-1, 1] samples
        size_t min_text_chars = 3;
        size_t dedup_window = 3;            ///< Compare against this many accepted texts
        size_t rtf_window = 5;              ///< Chunks averaged for the slow warning
        SegmentCallback on_segment;         ///< Invoked on the worker thread
    };

    struct Stats {
        size_t processed = 0;   ///< Chunks taken off the queue
        size_t accepted = 0;
        size_t filtered = 0;
        size_t failed = 0;
        size_t dropped = 0;     ///< Chunks the input queue rejected
        double average_rtf = 0.0;
        size_t slow_warnings = 0;      ///< Times the recent RTF fell below 1.0
        bool falling_behind = false;   ///< Recent RTF is below 1.0 right now
        size_t input_queue_size = 0;
        size_t output_queue_size = 0;
    };

    RecognitionWorker(std::shared_ptr<asr::IRecognizer> recognizer,
                      BoundedQueue<AudioChunk>& input,
                      BoundedQueue<TranscriptSegment>& output,
                      Config config);
    ~RecognitionWorker();

    RecognitionWorker(const RecognitionWorker&) = delete;
    RecognitionWorker& operator=(const RecognitionWorker&) = delete;

    bool start();

    // Stops dequeuing, lets the in-flight call finish, joins
    void stop();

    // Waits for the thread to exit on its own (input queue stopped and drained)
    void join();

    bool is_running() const { return running_.load(); }
    Stats stats() const;

    // Text is empty after dropping filler tokens (um, uh, ah, hmm, er, mm)
    static bool is_filler_only(const std::string& text);
    static double mean_square_energy(const std::vector<int16_t>& samples);

private:
    void run();
    void process(const AudioChunk& chunk);
    bool is_repeat(const std::string& normalized) const;
    void record_rtf(double rtf);

    std::shared_ptr<asr::IRecognizer> recognizer_;
    BoundedQueue<AudioChunk>& input_;
    BoundedQueue<TranscriptSegment>& output_;
    Config config_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<size_t> processed_{0};
    std::atomic<size_t> accepted_{0};
    std::atomic<size_t> filtered_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<double> average_rtf_{0.0};
    std::atomic<size_t> slow_warnings_{0};
    std::atomic<bool> slow_warned_{false};

    // Worker thread only
    std::deque<std::string> recent_texts_;
    std::deque<double> recent_rtf_;
    size_t rtf_samples_ = 0;
};

} // namespace core
