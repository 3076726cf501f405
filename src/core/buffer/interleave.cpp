#include "core/buffer/interleave.hpp"
#include "core/errors.hpp"

#include <string>

namespace apollo::core::buffer {

size_t deinterleave(const float* interleaved, size_t frameCount, SampleBuffer& buffer) {
    if (frameCount != buffer.getSampleCount()) {
        throw ShapeMismatchError("Interleaved block has " + std::to_string(frameCount) +
                                 " frames, buffer is bound to " + std::to_string(buffer.getSampleCount()));
    }
    if (!buffer.isBound() || frameCount == 0) {
        return 0;
    }

    const float* frame = interleaved;
    for (auto samples : buffer.iterSamples()) {
        for (float& sample : samples) {
            sample = *frame++;
        }
    }
    return frameCount;
}

size_t interleave(SampleBuffer& buffer, float* interleaved) {
    if (!buffer.isBound()) {
        return 0;
    }

    float* frame = interleaved;
    for (auto samples : buffer.iterSamples()) {
        for (float sample : samples) {
            *frame++ = sample;
        }
    }
    return buffer.getSampleCount();
}

} // namespace apollo::core::buffer
