// Copyright (c) 2025 VAM Live Scribe
#pragma once

#include "asr/recognizer.hpp"
#include "audio/stream_audio_source.hpp"
#include "core/bounded_queue.hpp"
#include "core/recognition_worker.hpp"
#include "core/result.hpp"
#include "core/transcript_assembler.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Live transcription of a media stream
 *
 * Wires the pipeline:
 *   StreamAudioSource -> chunk queue (drop newest) -> RecognitionWorker(s)
 *   -> result queue (drop oldest) -> TranscriptAssembler
 *
 * The decode thread never blocks: when recognition falls behind, chunks are
 * dropped and counted. Results are pulled by the caller with try_get_result()
 * or pump(); both feed the assembler.
 *
 * Event-based API (status and error callbacks) matches the desktop controller.
 */
class LiveSession {
public:
    /**
     * @brief Callback for status updates
     * @param message Status message
     * @param is_error True if this is an error message
     */
    using StatusCallback = std::function<void(const std::string& message, bool is_error)>;

    /// Terminal errors only (SourceUnavailable)
    using ErrorCallback = std::function<void(const Error& error)>;

    /// Receives the whole transcript once, when the session stops
    using TranscriptSink = std::function<void(const std::vector<TranscriptSegment>& segments,
                                              const std::string& full_text)>;

    struct Config {
        audio::StreamAudioSource::Config source;
        RecognitionWorker::Config worker;
        TranscriptAssembler::Config assembler;
        size_t chunk_queue_capacity = 10;
        size_t result_queue_capacity = 50;
        int workers = 1;                ///< More than one reorders results; batches are re-sorted

        StatusCallback on_status;
        ErrorCallback on_error;
        TranscriptSink on_persist;
    };

    struct PerformanceMetrics {
        uint64_t chunks_emitted = 0;
        size_t chunks_processed = 0;
        size_t segments_accepted = 0;
        size_t segments_filtered = 0;
        size_t chunks_failed = 0;
        size_t chunks_dropped = 0;      ///< Chunk queue overflow
        size_t results_evicted = 0;     ///< Result queue overflow
        double average_rtf = 0.0;       ///< >1.0 = faster than real time
        size_t chunk_queue_size = 0;
        size_t result_queue_size = 0;
    };

    explicit LiveSession(std::shared_ptr<asr::IRecognizer> recognizer);
    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    // SourceUnavailable when the decoder cannot be spawned
    Status start(const Config& config);

    /**
     * @brief Stop the source and workers, drain results into the transcript
     * and hand it to on_persist. Safe to call more than once.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // True once the source ended on its own (EOF or error)
    bool source_ended() const { return source_ended_.load(); }

    // Blocks until the source ended and every worker drained the chunk queue
    bool wait_until_finished(std::chrono::milliseconds timeout);

    // Non-blocking; the segment is also added to the transcript
    bool try_get_result(TranscriptSegment& segment);

    // Moves every pending result into the transcript; returns how many
    size_t pump();

    std::string render();
    std::string render_full();
    const TranscriptAssembler& transcript() const { return assembler_; }

    std::optional<Error> last_error() const;
    PerformanceMetrics get_performance_metrics() const;

private:
    void on_chunk(AudioChunk&& chunk);
    void on_source_end(const std::optional<Error>& error);
    void notify(const std::string& message, bool is_error) const;
    bool workers_done() const;

    std::shared_ptr<asr::IRecognizer> recognizer_;
    Config config_;

    std::unique_ptr<BoundedQueue<AudioChunk>> chunk_queue_;
    std::unique_ptr<BoundedQueue<TranscriptSegment>> result_queue_;
    std::vector<std::unique_ptr<RecognitionWorker>> workers_;
    audio::StreamAudioSource source_;
    TranscriptAssembler assembler_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex error_mutex_;
    std::optional<Error> last_error_;
    std::atomic<bool> running_{false};
    std::atomic<bool> source_ended_{false};
    std::atomic<bool> persisted_{false};
};

} // namespace core
