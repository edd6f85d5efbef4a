#pragma once

#include "audio/audio_chunker.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <sys/types.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace audio {

/**
 * @brief Live audio from an external decoder process (ffmpeg by default)
 *
 * The decoder writes raw s16le mono PCM to a pipe. A dedicated decode thread
 * reads the pipe, chunks the stream and hands chunks to the chunk callback.
 * The callback runs on the decode thread and must not block; the live session
 * pushes into a drop-when-full queue.
 *
 * Thread Safety:
 * - stop() may be called from any thread, any number of times
 * - callbacks are invoked from the decode thread
 */
class StreamAudioSource {
public:
    struct Config {
        std::string locator;                 ///< Already-resolved media URL or path
        int sample_rate = core::kCanonicalSampleRate;
        double chunk_seconds = 3.0;
        std::string program = "ffmpeg";
        std::vector<std::string> args;       ///< Replaces the ffmpeg arguments when non-empty
        size_t read_block_bytes = 4096;
        int stop_grace_ms = 3000;            ///< SIGTERM to SIGKILL delay
    };

    using ChunkCallback = std::function<void(core::AudioChunk&& chunk)>;
    /// Called once when the stream ends; no error means a clean end of stream or stop()
    using EndCallback = std::function<void(const std::optional<core::Error>& error)>;

    StreamAudioSource();
    ~StreamAudioSource();

    StreamAudioSource(const StreamAudioSource&) = delete;
    StreamAudioSource& operator=(const StreamAudioSource&) = delete;

    // SourceUnavailable when the decoder cannot be spawned
    core::Status start(const Config& config, ChunkCallback on_chunk, EndCallback on_end = nullptr);

    // Terminate the decoder (SIGTERM, grace period, SIGKILL) and join the decode thread
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t bytes_read() const { return bytes_read_.load(); }
    uint64_t chunks_emitted() const { return chunks_emitted_.load(); }
    // The decoder ignored SIGTERM and was killed after the grace period
    bool decoder_killed() const { return killed_.load(); }

    // Most recent audio for callers that want overlap with the next chunk
    std::vector<int16_t> last_seconds(double seconds) const;

    static std::vector<std::string> ffmpeg_args(const Config& config);

private:
    void decode_loop();
    void emit(core::AudioChunk&& chunk);
    int terminate_child(bool force);

    Config config_;
    ChunkCallback on_chunk_;
    EndCallback on_end_;

    std::unique_ptr<AudioChunker> chunker_;
    mutable std::mutex chunker_mutex_;

    std::mutex lifecycle_mutex_;    // serializes start()/stop()
    std::mutex child_mutex_;        // guards pid_ and reaping
    pid_t pid_ = -1;
    bool reaped_ = true;
    int exit_status_ = 0;
    int read_fd_ = -1;

    std::thread decode_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> chunks_emitted_{0};
    std::atomic<bool> killed_{false};
};

} // namespace audio
