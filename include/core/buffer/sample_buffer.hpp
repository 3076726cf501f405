#pragma once

#include <vector>
#include <cstddef>
#include <iterator>

#include "core/buffer/channel_slice.hpp"

namespace apollo::core::buffer {

class SamplesRange;

/**
 * Multi-channel sample buffer bound to host-owned storage
 *
 * Each processing block the host binds one contiguous float slice per
 * channel; all channels share one length for the lifetime of the binding.
 * The buffer never copies or persists the storage it borrows.
 *
 * Two access paths are offered:
 * - getChannel(): the full slice of one channel, for bulk algorithms
 * - iterSamples(): one ChannelSamples view per sample index, giving
 *   mutable access to that index in every channel
 *
 * Only one ChannelSamples view may be alive at a time, and no other path
 * into the storage may be used while it is. The view type cannot be
 * copied or moved, so it cannot escape the loop body that received it.
 * The buffer is not synchronized; do not share a bound buffer across
 * threads.
 */
class SampleBuffer {
public:
    /**
     * Constructs an unbound buffer (zero channels, zero samples)
     */
    SampleBuffer();

    size_t getChannelCount() const { return channels_.size(); }
    size_t getSampleCount() const { return sampleCount_; }
    bool isBound() const { return !channels_.empty(); }

    /**
     * Get the full sample slice of one channel
     * @throws IndexOutOfRangeError when channel >= getChannelCount()
     */
    ChannelSlice getChannel(size_t channel) const;

    /**
     * Rebind to new externally-owned channel storage
     * @param channels One slice per channel
     * @throws ShapeMismatchError if the slices differ in length or a
     *         non-empty slice has no storage; the previous binding is
     *         left unchanged
     */
    void bind(const std::vector<ChannelSlice>& channels);

    /**
     * Rebind to a host-style array of channel pointers
     * @param channels Array of numChannels pointers, each to numSamples floats
     * @throws ShapeMismatchError if a channel pointer is null while
     *         numSamples is non-zero
     */
    void bind(float* const* channels, size_t numChannels, size_t numSamples);

    /**
     * Rebind to caller-owned vectors. The vectors must not be resized
     * while bound.
     * @throws ShapeMismatchError if the vectors differ in length
     */
    void bind(std::vector<std::vector<float>>& channels);

    /**
     * Drop the current binding
     */
    void unbind();

    /**
     * Iterate every sample index in ascending order
     */
    SamplesRange iterSamples();

    /**
     * Iterate sample indices [start, end)
     * @throws IndexOutOfRangeError if start > end or end > getSampleCount()
     */
    SamplesRange iterSamples(size_t start, size_t end);

private:
    friend class ChannelSamples;

    std::vector<ChannelSlice> channels_;
    size_t sampleCount_;
};

/**
 * Cross-channel view of one sample index
 *
 * Holds only the buffer reference and the sample index; every access
 * re-derives the element from the channel slices and is bounds-checked
 * against the current binding, so a rebind or unbind of the buffer while
 * the view is alive throws IndexOutOfRangeError instead of reading past
 * the new storage. Produced by SamplesIterator and valid until the
 * iterator advances.
 */
class ChannelSamples {
public:
    /**
     * Iterates the per-channel values of this sample index in channel order
     */
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = float;
        using difference_type = std::ptrdiff_t;
        using pointer = float*;
        using reference = float&;

        Iterator() = default;
        Iterator(const ChannelSamples* samples, size_t channel)
            : samples_(samples), channel_(channel) {}

        float& operator*() const { return samples_->at(channel_); }
        float* operator->() const { return &samples_->at(channel_); }

        Iterator& operator++() {
            ++channel_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++channel_;
            return previous;
        }

        bool operator==(const Iterator& other) const {
            return samples_ == other.samples_ && channel_ == other.channel_;
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        const ChannelSamples* samples_ = nullptr;
        size_t channel_ = 0;
    };

    ChannelSamples(const ChannelSamples&) = delete;
    ChannelSamples& operator=(const ChannelSamples&) = delete;
    ChannelSamples(ChannelSamples&&) = delete;
    ChannelSamples& operator=(ChannelSamples&&) = delete;

    size_t getSampleIndex() const { return sampleIndex_; }

    /**
     * Number of channels
     */
    size_t size() const { return buffer_.channels_.size(); }

    float& operator[](size_t channel) const { return at(channel); }

    /**
     * @throws IndexOutOfRangeError when channel >= size() or the sample
     *         index is past the buffer's current sample count
     */
    float& at(size_t channel) const;

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, size()); }

private:
    friend class SamplesIterator;

    ChannelSamples(SampleBuffer& buffer, size_t sampleIndex)
        : buffer_(buffer), sampleIndex_(sampleIndex) {}

    SampleBuffer& buffer_;
    size_t sampleIndex_;
};

/**
 * Input iterator over sample indices; dereferencing yields a fresh
 * ChannelSamples view for the current index.
 */
class SamplesIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ChannelSamples;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = ChannelSamples;

    SamplesIterator(SampleBuffer& buffer, size_t sampleIndex)
        : buffer_(&buffer), sampleIndex_(sampleIndex) {}

    ChannelSamples operator*() const { return ChannelSamples(*buffer_, sampleIndex_); }

    SamplesIterator& operator++() {
        ++sampleIndex_;
        return *this;
    }

    bool operator==(const SamplesIterator& other) const {
        return buffer_ == other.buffer_ && sampleIndex_ == other.sampleIndex_;
    }
    bool operator!=(const SamplesIterator& other) const { return !(*this == other); }

private:
    SampleBuffer* buffer_;
    size_t sampleIndex_;
};

/**
 * Finite, lazily evaluated sequence of per-sample views over [start, end)
 */
class SamplesRange {
public:
    SamplesRange(SampleBuffer& buffer, size_t start, size_t end)
        : buffer_(buffer), start_(start), end_(end) {}

    SamplesIterator begin() const { return SamplesIterator(buffer_, start_); }
    SamplesIterator end() const { return SamplesIterator(buffer_, end_); }

    size_t size() const { return end_ - start_; }
    bool empty() const { return start_ == end_; }

private:
    SampleBuffer& buffer_;
    size_t start_;
    size_t end_;
};

} // namespace apollo::core::buffer
