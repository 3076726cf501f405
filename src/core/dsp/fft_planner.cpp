#include "core/dsp/fft_planner.hpp"
#include "core/errors.hpp"
#include "system/logger.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace apollo::core::dsp {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

FFTPlan::FFTPlan(size_t length)
    : length_(length)
    , convolutionLength_(0) {
    if (length == 0) {
        throw InvalidBufferLengthError("FFT length must be positive");
    }

    if (isPowerOfTwo(length_)) {
        initializeRadix2();
    } else {
        initializeBluestein();
    }
}

FFTPlan::~FFTPlan() = default;

bool FFTPlan::isPowerOfTwo(size_t n) {
    return n > 0 && (n & (n - 1)) == 0;
}

size_t FFTPlan::nextPowerOfTwo(size_t n) {
    size_t power = 1;
    while (power < n) {
        power <<= 1;
    }
    return power;
}

void FFTPlan::initializeRadix2() {
    twiddles_.resize(length_ / 2);
    for (size_t k = 0; k < twiddles_.size(); ++k) {
        double angle = -2.0 * kPi * static_cast<double>(k) / static_cast<double>(length_);
        twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
    }

    size_t bits = 0;
    while ((size_t{1} << bits) < length_) {
        ++bits;
    }

    bitReverse_.resize(length_);
    for (size_t i = 0; i < length_; ++i) {
        size_t reversed = 0;
        for (size_t b = 0; b < bits; ++b) {
            if (i & (size_t{1} << b)) {
                reversed |= size_t{1} << (bits - 1 - b);
            }
        }
        bitReverse_[i] = reversed;
    }
}

void FFTPlan::initializeBluestein() {
    convolutionLength_ = nextPowerOfTwo(2 * length_ - 1);
    innerPlan_ = std::make_unique<FFTPlan>(convolutionLength_);

    // w[n] = exp(-i*pi*n^2/N); n^2 is reduced mod 2N to keep the angle exact
    chirp_.resize(length_);
    const unsigned long long period = 2ULL * length_;
    for (size_t n = 0; n < length_; ++n) {
        unsigned long long square = (static_cast<unsigned long long>(n) * n) % period;
        double angle = -kPi * static_cast<double>(square) / static_cast<double>(length_);
        chirp_[n] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                        static_cast<float>(std::sin(angle)));
    }

    // Spectrum of the conjugate chirp, wrapped to the circular convolution
    // length and pre-divided by it so the inverse transform needs no scaling
    chirpSpectrum_.assign(convolutionLength_, std::complex<float>(0.0f, 0.0f));
    chirpSpectrum_[0] = std::conj(chirp_[0]);
    for (size_t n = 1; n < length_; ++n) {
        chirpSpectrum_[n] = std::conj(chirp_[n]);
        chirpSpectrum_[convolutionLength_ - n] = std::conj(chirp_[n]);
    }
    innerPlan_->process(chirpSpectrum_.data(), nullptr);

    const float scale = 1.0f / static_cast<float>(convolutionLength_);
    for (auto& value : chirpSpectrum_) {
        value *= scale;
    }
}

void FFTPlan::process(std::complex<float>* data, std::complex<float>* scratch) const {
    if (convolutionLength_ == 0) {
        processRadix2(data);
    } else {
        processBluestein(data, scratch);
    }
}

void FFTPlan::processRadix2(std::complex<float>* data) const {
    for (size_t i = 0; i < length_; ++i) {
        size_t j = bitReverse_[i];
        if (i < j) {
            std::swap(data[i], data[j]);
        }
    }

    for (size_t size = 2; size <= length_; size <<= 1) {
        const size_t half = size / 2;
        const size_t step = length_ / size;
        for (size_t start = 0; start < length_; start += size) {
            for (size_t j = 0; j < half; ++j) {
                std::complex<float> t = twiddles_[j * step] * data[start + j + half];
                std::complex<float> u = data[start + j];
                data[start + j] = u + t;
                data[start + j + half] = u - t;
            }
        }
    }
}

void FFTPlan::processBluestein(std::complex<float>* data, std::complex<float>* scratch) const {
    if (scratch == nullptr) {
        throw InvalidBufferLengthError("Bluestein FFT of length " + std::to_string(length_) +
                                       " requires a scratch area");
    }

    for (size_t n = 0; n < length_; ++n) {
        scratch[n] = data[n] * chirp_[n];
    }
    for (size_t n = length_; n < convolutionLength_; ++n) {
        scratch[n] = std::complex<float>(0.0f, 0.0f);
    }

    innerPlan_->process(scratch, nullptr);

    // Pointwise product, then inverse transform via conj(FFT(conj(x)))
    for (size_t k = 0; k < convolutionLength_; ++k) {
        scratch[k] = std::conj(scratch[k] * chirpSpectrum_[k]);
    }
    innerPlan_->process(scratch, nullptr);

    for (size_t k = 0; k < length_; ++k) {
        data[k] = std::conj(scratch[k]) * chirp_[k];
    }
}

FFTPlanner::FFTPlanner(size_t maxCachedPlans)
    : maxCachedPlans_(maxCachedPlans)
    , useCounter_(0) {
    if (maxCachedPlans == 0) {
        throw InvalidConfigurationError("FFT plan cache must hold at least one plan");
    }
}

std::shared_ptr<const FFTPlan> FFTPlanner::planForward(size_t length) {
    auto it = plans_.find(length);
    if (it != plans_.end()) {
        it->second.lastUse = ++useCounter_;
        return it->second.plan;
    }

    auto plan = std::make_shared<const FFTPlan>(length);
    if (plans_.size() >= maxCachedPlans_) {
        evictLeastRecentlyUsed();
    }
    plans_.emplace(length, CachedPlan{plan, ++useCounter_});
    LOG_DEBUG("Planned {} FFT of length {}", plan->usesBluestein() ? "Bluestein" : "radix-2", length);
    return plan;
}

void FFTPlanner::evictLeastRecentlyUsed() {
    auto oldest = plans_.begin();
    for (auto it = plans_.begin(); it != plans_.end(); ++it) {
        if (it->second.lastUse < oldest->second.lastUse) {
            oldest = it;
        }
    }
    if (oldest != plans_.end()) {
        LOG_DEBUG("Evicting cached FFT plan of length {}", oldest->first);
        plans_.erase(oldest);
    }
}

} // namespace apollo::core::dsp
