#include "audio/stream_audio_source.hpp"
#include "core/logging.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace audio {

namespace {
std::string describe_status(int status) {
    if (status < 0) return "unknown status";
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
} // namespace

StreamAudioSource::StreamAudioSource() = default;

StreamAudioSource::~StreamAudioSource() {
    stop();
}

std::vector<std::string> StreamAudioSource::ffmpeg_args(const Config& config) {
    return {
        "-hide_banner", "-loglevel", "error", "-nostdin",
        "-fflags", "nobuffer", "-flags", "low_delay", "-fflags", "+discardcorrupt",
        "-i", config.locator,
        "-f", "s16le", "-acodec", "pcm_s16le",
        "-ar", std::to_string(config.sample_rate), "-ac", "1",
        "pipe:1"
    };
}

core::Status StreamAudioSource::start(const Config& config, ChunkCallback on_chunk, EndCallback on_end) {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    if (running_.load()) {
        return core::Status::fail(core::ErrorKind::SourceUnavailable, "source already running");
    }
    if (decode_thread_.joinable()) {
        decode_thread_.join();  // previous stream ended on its own
    }
    close_fd(read_fd_);

    config_ = config;
    on_chunk_ = std::move(on_chunk);
    on_end_ = std::move(on_end);

    // argv is built before fork so the child only calls async-signal-safe functions
    std::vector<std::string> args;
    args.push_back(config_.program);
    const std::vector<std::string> tail = config_.args.empty() ? ffmpeg_args(config_) : config_.args;
    args.insert(args.end(), tail.begin(), tail.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return core::Status::fail(core::ErrorKind::SourceUnavailable, std::string("pipe failed: ") + std::strerror(errno));
    }
    // Reports exec failure: closed by a successful exec, written to by a failed one
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const int e = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return core::Status::fail(core::ErrorKind::SourceUnavailable, std::string("pipe failed: ") + std::strerror(e));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        return core::Status::fail(core::ErrorKind::SourceUnavailable, std::string("fork failed: ") + std::strerror(e));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ::close(out_pipe[0]);
        core::log_error("[source] cannot start '" + config_.program + "': " + std::strerror(child_errno));
        return core::Status::fail(core::ErrorKind::SourceUnavailable,
                                  "cannot start '" + config_.program + "': " + std::strerror(child_errno));
    }

    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        pid_ = pid;
        reaped_ = false;
        exit_status_ = 0;
    }
    read_fd_ = out_pipe[0];

    AudioChunker::Config chunker_cfg;
    chunker_cfg.sample_rate = config_.sample_rate;
    chunker_cfg.chunk_seconds = config_.chunk_seconds;
    {
        std::lock_guard<std::mutex> lock(chunker_mutex_);
        chunker_ = std::make_unique<AudioChunker>(chunker_cfg);
    }

    bytes_read_ = 0;
    chunks_emitted_ = 0;
    killed_ = false;
    stopping_ = false;
    running_ = true;
    decode_thread_ = std::thread(&StreamAudioSource::decode_loop, this);

    core::log_info("[source] decoding " + (config_.locator.empty() ? config_.program : config_.locator) +
                   " (pid " + std::to_string(pid) + ")");
    return core::ok_status();
}

void StreamAudioSource::emit(core::AudioChunk&& chunk) {
    chunks_emitted_++;
    if (!on_chunk_) return;
    try {
        on_chunk_(std::move(chunk));
    } catch (const std::exception& e) {
        core::log_error(std::string("[source] chunk callback threw: ") + e.what());
    }
}

void StreamAudioSource::decode_loop() {
    std::vector<uint8_t> buf(std::max<size_t>(2, config_.read_block_bytes));
    std::vector<int16_t> pcm;
    pcm.reserve(buf.size() / 2 + 1);
    bool have_odd = false;
    uint8_t odd_byte = 0;
    std::optional<core::Error> error;

    while (true) {
        const ssize_t n = ::read(read_fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            if (!stopping_.load()) {
                error = core::Error{core::ErrorKind::SourceUnavailable,
                                    std::string("read from decoder failed: ") + std::strerror(errno)};
            }
            break;
        }
        if (n == 0) {
            break;  // decoder closed its output
        }
        bytes_read_ += static_cast<uint64_t>(n);

        // s16le: reassemble samples, carrying an odd trailing byte into the next read
        pcm.clear();
        size_t i = 0;
        if (have_odd) {
            pcm.push_back(static_cast<int16_t>(static_cast<uint16_t>(odd_byte) | (static_cast<uint16_t>(buf[0]) << 8)));
            have_odd = false;
            i = 1;
        }
        const size_t len = static_cast<size_t>(n);
        for (; i + 1 < len; i += 2) {
            pcm.push_back(static_cast<int16_t>(static_cast<uint16_t>(buf[i]) | (static_cast<uint16_t>(buf[i + 1]) << 8)));
        }
        if (i < len) {
            odd_byte = buf[i];
            have_odd = true;
        }

        std::vector<core::AudioChunk> chunks;
        {
            std::lock_guard<std::mutex> lock(chunker_mutex_);
            chunks = chunker_->feed(pcm.data(), pcm.size(), config_.sample_rate);
        }
        for (auto& c : chunks) emit(std::move(c));
    }

    std::optional<core::AudioChunk> tail;
    {
        std::lock_guard<std::mutex> lock(chunker_mutex_);
        tail = chunker_->flush();
    }
    if (tail) emit(std::move(*tail));

    const int status = terminate_child(false);
    if (!stopping_.load()) {
        if (!error && bytes_read_.load() == 0) {
            error = core::Error{core::ErrorKind::SourceUnavailable,
                                "decoder exited before producing audio (" + describe_status(status) + ")"};
        } else if (status != 0) {
            core::log_warn("[source] decoder ended with " + describe_status(status));
        }
    }
    if (error) {
        core::log_error("[source] " + error->message);
    } else {
        core::log_info("[source] end of stream after " + std::to_string(bytes_read_.load()) + " bytes");
    }

    running_ = false;
    if (on_end_) {
        try {
            on_end_(error);
        } catch (const std::exception& e) {
            core::log_error(std::string("[source] end callback threw: ") + e.what());
        }
    }
}

int StreamAudioSource::terminate_child(bool force) {
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (reaped_ || pid_ <= 0) return exit_status_;

    // The decoder runs in its own process group so shell wrappers die with it
    if (force) {
        ::kill(-pid_, SIGTERM);
        ::kill(pid_, SIGTERM);
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.stop_grace_ms);
    int status = 0;
    while (true) {
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) break;
        if (r < 0 && errno != EINTR) {
            status = -1;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            core::log_warn("[source] decoder did not exit in " + std::to_string(config_.stop_grace_ms) + " ms, killing");
            ::kill(-pid_, SIGKILL);
            ::kill(pid_, SIGKILL);
            killed_ = true;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reaped_ = true;
    exit_status_ = status;
    return status;
}

void StreamAudioSource::stop() {
    // From a callback on the decode thread: signal only, the owner joins later
    if (decode_thread_.joinable() && std::this_thread::get_id() == decode_thread_.get_id()) {
        stopping_ = true;
        terminate_child(true);
        return;
    }

    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    stopping_ = true;
    terminate_child(true);
    if (decode_thread_.joinable()) {
        decode_thread_.join();
    }
    close_fd(read_fd_);
    running_ = false;
}

std::vector<int16_t> StreamAudioSource::last_seconds(double seconds) const {
    std::lock_guard<std::mutex> lock(chunker_mutex_);
    if (!chunker_) return {};
    return chunker_->last_seconds(seconds);
}

} // namespace audio
