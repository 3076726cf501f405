#pragma once

#include <cstddef>

#include "core/buffer/sample_buffer.hpp"

namespace apollo::core::buffer {

/**
 * Copy interleaved frames into the buffer's bound channel storage.
 * @param interleaved frameCount * getChannelCount() samples, frame-major
 * @return number of frames copied
 * @throws ShapeMismatchError if frameCount != buffer.getSampleCount()
 */
size_t deinterleave(const float* interleaved, size_t frameCount, SampleBuffer& buffer);

/**
 * Copy the buffer's channels out as interleaved frames.
 * @param interleaved destination for getSampleCount() * getChannelCount() samples
 * @return number of frames copied
 */
size_t interleave(SampleBuffer& buffer, float* interleaved);

} // namespace apollo::core::buffer
