// Copyright (c) 2025 VAM Live Scribe
// LiveSession - Streaming Transcription Pipeline
//
// Decode Thread (never blocks):
//   - StreamAudioSource reads decoder output and cuts fixed-duration chunks
//   - Each chunk is pushed to the chunk queue; full queue = chunk dropped
//
// Worker Thread(s):
//   - Pop chunks (blocks waiting for data), recognize, filter
//   - Push segments to the result queue; full queue = oldest result evicted
//
// Caller Thread:
//   - try_get_result() / pump() move results into the TranscriptAssembler
//   - stop() drains what is left and persists the transcript once

#include "core/live_session.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <thread>

namespace core {

LiveSession::LiveSession(std::shared_ptr<asr::IRecognizer> recognizer)
    : recognizer_(std::move(recognizer)) {}

LiveSession::~LiveSession() {
    stop();
}

void LiveSession::notify(const std::string& message, bool is_error) const {
    if (is_error) {
        log_error("[session] " + message);
    } else {
        log_info("[session] " + message);
    }
    if (config_.on_status) {
        try {
            config_.on_status(message, is_error);
        } catch (const std::exception& e) {
            log_error(std::string("[session] status callback threw: ") + e.what());
        }
    }
}

Status LiveSession::start(const Config& config) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return Status::fail(ErrorKind::SourceUnavailable, "session already running");
    }
    if (!recognizer_ || !recognizer_->available()) {
        return Status::fail(ErrorKind::RecognitionFailed, "recognizer not available");
    }

    config_ = config;
    source_ended_.store(false);
    persisted_.store(false);
    {
        std::lock_guard<std::mutex> elock(error_mutex_);
        last_error_.reset();
    }
    assembler_.clear();
    assembler_.set_config(config_.assembler);

    // Old workers reference the old queues
    workers_.clear();
    chunk_queue_ = std::make_unique<BoundedQueue<AudioChunk>>(config_.chunk_queue_capacity,
                                                              OverflowPolicy::DropNewest);
    result_queue_ = std::make_unique<BoundedQueue<TranscriptSegment>>(config_.result_queue_capacity,
                                                                      OverflowPolicy::DropOldest);

    const int n_workers = std::max(1, config_.workers);
    for (int i = 0; i < n_workers; ++i) {
        auto worker = std::make_unique<RecognitionWorker>(recognizer_, *chunk_queue_, *result_queue_, config_.worker);
        worker->start();
        workers_.push_back(std::move(worker));
    }

    Status st = source_.start(config_.source,
                              [this](AudioChunk&& chunk) { on_chunk(std::move(chunk)); },
                              [this](const std::optional<Error>& error) { on_source_end(error); });
    if (!st.ok()) {
        persisted_.store(true);
        for (auto& w : workers_) w->stop();
        workers_.clear();
        {
            std::lock_guard<std::mutex> elock(error_mutex_);
            last_error_ = st.error();
        }
        notify(st.error().message, true);
        return st;
    }

    running_.store(true);
    notify("Live session started with " + recognizer_->name() + ", " + std::to_string(n_workers) + " worker(s)",
           false);
    return ok_status();
}

void LiveSession::on_chunk(AudioChunk&& chunk) {
    const uint64_t index = chunk.index;
    if (!chunk_queue_->push(std::move(chunk))) {
        log_debug("[session] chunk " + std::to_string(index) + " dropped (queue full)");
    }
}

void LiveSession::on_source_end(const std::optional<Error>& error) {
    source_ended_.store(true);
    // Workers finish what is queued and exit
    chunk_queue_->stop();

    if (!error) {
        notify("Stream ended", false);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = *error;
    }
    notify(error->describe(), true);
    if (config_.on_error) {
        try {
            config_.on_error(*error);
        } catch (const std::exception& e) {
            log_error(std::string("[session] error callback threw: ") + e.what());
        }
    }
}

bool LiveSession::workers_done() const {
    for (const auto& w : workers_) {
        if (w->is_running()) return false;
    }
    return true;
}

bool LiveSession::wait_until_finished(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (source_ended_.load() && workers_done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return source_ended_.load() && workers_done();
}

bool LiveSession::try_get_result(TranscriptSegment& segment) {
    if (!result_queue_ || !result_queue_->try_pop(segment)) return false;
    assembler_.add_segment(segment);
    return true;
}

size_t LiveSession::pump() {
    if (!result_queue_) return 0;
    std::vector<TranscriptSegment> batch = result_queue_->drain();
    std::stable_sort(batch.begin(), batch.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start < b.start; });
    for (const auto& seg : batch) assembler_.add_segment(seg);
    return batch.size();
}

std::string LiveSession::render() {
    pump();
    return assembler_.render();
}

std::string LiveSession::render_full() {
    pump();
    return assembler_.render_full();
}

void LiveSession::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!chunk_queue_) return;

    const bool was_running = running_.exchange(false);
    source_.stop();
    for (auto& w : workers_) w->stop();

    pump();

    if (!persisted_.exchange(true) && config_.on_persist) {
        try {
            config_.on_persist(assembler_.all_segments(), assembler_.render_full());
        } catch (const std::exception& e) {
            log_error(std::string("[session] persisting transcript failed: ") + e.what());
        }
    }
    if (was_running) {
        PerformanceMetrics m = get_performance_metrics();
        notify("Live session stopped: " + std::to_string(m.segments_accepted) + " segments, " +
                   std::to_string(m.chunks_dropped) + " chunks dropped",
               false);
    }
}

std::optional<Error> LiveSession::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

LiveSession::PerformanceMetrics LiveSession::get_performance_metrics() const {
    PerformanceMetrics m;
    m.chunks_emitted = source_.chunks_emitted();
    double rtf_sum = 0.0;
    for (const auto& w : workers_) {
        RecognitionWorker::Stats s = w->stats();
        m.chunks_processed += s.processed;
        m.segments_accepted += s.accepted;
        m.segments_filtered += s.filtered;
        m.chunks_failed += s.failed;
        rtf_sum += s.average_rtf;
    }
    if (!workers_.empty()) m.average_rtf = rtf_sum / workers_.size();
    if (chunk_queue_) {
        m.chunks_dropped = chunk_queue_->dropped_count();
        m.chunk_queue_size = chunk_queue_->size();
    }
    if (result_queue_) {
        m.results_evicted = result_queue_->dropped_count();
        m.result_queue_size = result_queue_->size();
    }
    return m;
}

} // namespace core
