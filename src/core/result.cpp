#include "core/result.hpp"

namespace core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SourceUnavailable:      return "SourceUnavailable";
    case ErrorKind::ChunkDropped:           return "ChunkDropped";
    case ErrorKind::RecognitionFailed:      return "RecognitionFailed";
    case ErrorKind::DiarizationUnavailable: return "DiarizationUnavailable";
    case ErrorKind::TransientProvider:      return "TransientProvider";
    case ErrorKind::ProviderExhausted:      return "ProviderExhausted";
    case ErrorKind::AllProvidersExhausted:  return "AllProvidersExhausted";
    case ErrorKind::InvalidResponse:        return "InvalidResponse";
    case ErrorKind::AlignmentRejected:      return "AlignmentRejected";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = to_string(kind);
    if (http_status != 0) out += " (HTTP " + std::to_string(http_status) + ")";
    if (!message.empty()) out += ": " + message;
    return out;
}

} // namespace core
