#include "audio_types.hpp"

namespace apollo {

std::string processModeToString(ProcessMode mode) {
    switch (mode) {
        case ProcessMode::REALTIME: return "realtime";
        case ProcessMode::BUFFERED: return "buffered";
        case ProcessMode::OFFLINE: return "offline";
    }
    return "realtime";
}

bool parseProcessMode(const std::string& name, ProcessMode& mode) {
    if (name == "realtime") {
        mode = ProcessMode::REALTIME;
    } else if (name == "buffered") {
        mode = ProcessMode::BUFFERED;
    } else if (name == "offline") {
        mode = ProcessMode::OFFLINE;
    } else {
        return false;
    }
    return true;
}

} // namespace apollo
