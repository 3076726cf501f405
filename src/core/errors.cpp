#include "core/errors.hpp"

namespace apollo::core {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorCode::ShapeMismatch: return "ShapeMismatch";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::InvalidBufferLength: return "InvalidBufferLength";
    }
    return "Unknown";
}

} // namespace apollo::core
