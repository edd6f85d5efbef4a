#pragma once
#include "core/result.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace diar {

// Standalone "who spoke when" pass over a whole file, independent of recognition
class IDiarizer {
public:
    virtual ~IDiarizer() = default;
    virtual core::Result<std::vector<core::DiarizationInterval>> diarize(const std::string& audio_file) = 0;
    virtual bool available() const = 0;
    virtual std::string name() const = 0;
};

} // namespace diar
