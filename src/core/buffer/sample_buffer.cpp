#include "core/buffer/sample_buffer.hpp"
#include "core/errors.hpp"

#include <string>

namespace apollo::core::buffer {

float& ChannelSlice::at(size_t index) const {
    if (index >= size_) {
        throw IndexOutOfRangeError("Sample index " + std::to_string(index) +
                                   " out of range for channel of " + std::to_string(size_) + " samples");
    }
    return data_[index];
}

SampleBuffer::SampleBuffer()
    : sampleCount_(0) {
}

ChannelSlice SampleBuffer::getChannel(size_t channel) const {
    if (channel >= channels_.size()) {
        throw IndexOutOfRangeError("Channel index " + std::to_string(channel) +
                                   " out of range for buffer with " + std::to_string(channels_.size()) +
                                   " channels");
    }
    return channels_[channel];
}

void SampleBuffer::bind(const std::vector<ChannelSlice>& channels) {
    if (channels.empty()) {
        unbind();
        return;
    }

    const size_t length = channels.front().size();
    for (size_t ch = 0; ch < channels.size(); ++ch) {
        if (channels[ch].size() != length) {
            throw ShapeMismatchError("Channel " + std::to_string(ch) + " has " +
                                     std::to_string(channels[ch].size()) + " samples, expected " +
                                     std::to_string(length));
        }
        if (channels[ch].data() == nullptr && length > 0) {
            throw ShapeMismatchError("Channel " + std::to_string(ch) + " has no storage");
        }
    }

    // assign() keeps capacity, so rebinding the same channel count each block does not allocate
    channels_.assign(channels.begin(), channels.end());
    sampleCount_ = length;
}

void SampleBuffer::bind(float* const* channels, size_t numChannels, size_t numSamples) {
    if (numChannels == 0) {
        unbind();
        return;
    }

    if (channels == nullptr) {
        throw ShapeMismatchError("Null channel array for " + std::to_string(numChannels) + " channels");
    }
    for (size_t ch = 0; ch < numChannels; ++ch) {
        if (channels[ch] == nullptr && numSamples > 0) {
            throw ShapeMismatchError("Channel " + std::to_string(ch) + " has no storage");
        }
    }

    channels_.resize(numChannels);
    for (size_t ch = 0; ch < numChannels; ++ch) {
        channels_[ch] = ChannelSlice(channels[ch], numSamples);
    }
    sampleCount_ = numSamples;
}

void SampleBuffer::bind(std::vector<std::vector<float>>& channels) {
    std::vector<ChannelSlice> slices;
    slices.reserve(channels.size());
    for (auto& channel : channels) {
        slices.emplace_back(channel.data(), channel.size());
    }
    bind(slices);
}

void SampleBuffer::unbind() {
    channels_.clear();
    sampleCount_ = 0;
}

SamplesRange SampleBuffer::iterSamples() {
    return SamplesRange(*this, 0, sampleCount_);
}

SamplesRange SampleBuffer::iterSamples(size_t start, size_t end) {
    if (start > end || end > sampleCount_) {
        throw IndexOutOfRangeError("Sample range [" + std::to_string(start) + ", " + std::to_string(end) +
                                   ") out of range for " + std::to_string(sampleCount_) + " samples");
    }
    return SamplesRange(*this, start, end);
}

float& ChannelSamples::at(size_t channel) const {
    if (channel >= buffer_.channels_.size()) {
        throw IndexOutOfRangeError("Channel index " + std::to_string(channel) +
                                   " out of range for buffer with " +
                                   std::to_string(buffer_.channels_.size()) + " channels");
    }
    if (sampleIndex_ >= buffer_.sampleCount_) {
        throw IndexOutOfRangeError("Sample index " + std::to_string(sampleIndex_) +
                                   " out of range for buffer of " +
                                   std::to_string(buffer_.sampleCount_) + " samples");
    }
    return buffer_.channels_[channel][sampleIndex_];
}

} // namespace apollo::core::buffer
