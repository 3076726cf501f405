#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace apollo {

// Host processing mode
enum class ProcessMode {
    REALTIME,   // Fixed-rate real-time processing
    BUFFERED,   // Real-time pace, irregular block timing
    OFFLINE     // As fast as possible, no deadline
};

// Result of processing one block
enum class ProcessStatus {
    NORMAL,
    ERROR
};

// Block configuration announced by the host before processing starts
struct BufferConfig {
    float sampleRate = 44100.0f;
    std::optional<uint32_t> minBufferSize;
    uint32_t maxBufferSize = 1024;
    ProcessMode processMode = ProcessMode::REALTIME;
};

// Main bus channel layout
struct AudioIOLayout {
    uint32_t mainInputChannels = 0;
    uint32_t mainOutputChannels = 0;

    bool operator==(const AudioIOLayout& other) const {
        return mainInputChannels == other.mainInputChannels &&
               mainOutputChannels == other.mainOutputChannels;
    }
    bool operator!=(const AudioIOLayout& other) const { return !(*this == other); }
};

std::string processModeToString(ProcessMode mode);
bool parseProcessMode(const std::string& name, ProcessMode& mode);

} // namespace apollo
