#pragma once

#include <cstddef>

namespace apollo::core::buffer {

/**
 * Non-owning mutable view over one channel's contiguous samples.
 *
 * The storage belongs to the host for the duration of one process call;
 * a slice never outlives the block it was bound for.
 */
class ChannelSlice {
public:
    ChannelSlice() = default;
    ChannelSlice(float* data, size_t size) : data_(data), size_(size) {}

    float* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    float* begin() const { return data_; }
    float* end() const { return data_ + size_; }

    float& operator[](size_t index) const { return data_[index]; }

    /**
     * Bounds-checked element access
     * @throws IndexOutOfRangeError when index >= size()
     */
    float& at(size_t index) const;

private:
    float* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace apollo::core::buffer
