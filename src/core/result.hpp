#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace core {

enum class ErrorKind {
    SourceUnavailable,       ///< Decoder could not start or exited before producing audio
    ChunkDropped,            ///< Queue overflow; counted, never surfaced
    RecognitionFailed,       ///< One chunk or one file failed to recognize
    DiarizationUnavailable,  ///< No diarizer configured or loaded
    TransientProvider,       ///< HTTP 429 / 5xx or transport failure, safe to retry
    ProviderExhausted,       ///< Retries used up against one provider
    AllProvidersExhausted,   ///< Every provider in the chain failed
    InvalidResponse,         ///< Provider answered with something we cannot use
    AlignmentRejected        ///< Target left without a timestamp
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::RecognitionFailed;
    std::string message;
    int http_status = 0;    ///< 0 when the error did not come from an HTTP response

    std::string describe() const;
};

// Value-or-error returned by every provider and pipeline boundary.
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    static Result fail(ErrorKind kind, std::string message, int http_status = 0) {
        return Result(Error{kind, std::move(message), http_status});
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) throw std::logic_error("Result holds an error: " + error_.describe());
        return *value_;
    }
    T& value() {
        if (!value_) throw std::logic_error("Result holds an error: " + error_.describe());
        return *value_;
    }
    T take() { return std::move(value()); }

    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status(std::monostate{}); }

} // namespace core
