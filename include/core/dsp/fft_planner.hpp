#pragma once

#include <vector>
#include <complex>
#include <memory>
#include <unordered_map>
#include <cstddef>
#include <cstdint>

namespace apollo::core::dsp {

/**
 * Precomputed forward DFT of one fixed length
 *
 * Computes X[k] = sum_n x[n] * exp(-2*pi*i*k*n/N) in place, unnormalized.
 * Power-of-two lengths use an iterative radix-2 transform; every other
 * length goes through Bluestein's chirp-z algorithm on a power-of-two
 * inner transform. Plans are immutable once built and can be shared.
 */
class FFTPlan {
public:
    /**
     * @throws InvalidBufferLengthError if length is zero
     */
    explicit FFTPlan(size_t length);
    ~FFTPlan();

    FFTPlan(const FFTPlan&) = delete;
    FFTPlan& operator=(const FFTPlan&) = delete;

    size_t getLength() const { return length_; }

    /**
     * Number of complex values process() needs as work area
     */
    size_t getScratchLength() const { return convolutionLength_; }

    bool usesBluestein() const { return convolutionLength_ > 0; }

    /**
     * Transform getLength() values in place
     * @param data Input/output, getLength() values
     * @param scratch Work area of getScratchLength() values; may be null when that is zero
     */
    void process(std::complex<float>* data, std::complex<float>* scratch) const;

    static bool isPowerOfTwo(size_t n);
    static size_t nextPowerOfTwo(size_t n);

private:
    void initializeRadix2();
    void initializeBluestein();

    void processRadix2(std::complex<float>* data) const;
    void processBluestein(std::complex<float>* data, std::complex<float>* scratch) const;

    size_t length_;

    // Radix-2
    std::vector<std::complex<float>> twiddles_;
    std::vector<size_t> bitReverse_;

    // Bluestein
    size_t convolutionLength_;
    std::unique_ptr<FFTPlan> innerPlan_;
    std::vector<std::complex<float>> chirp_;
    std::vector<std::complex<float>> chirpSpectrum_;
};

/**
 * Cache of FFT plans keyed by transform length
 *
 * Repeated requests for the same length return the same plan, so block
 * sizes that stay constant across calls pay the setup cost once. The cache
 * holds at most getMaxCachedPlans() plans; planning a new length when it is
 * full evicts the least recently requested one. Plans already handed out
 * stay valid after eviction or clear().
 */
class FFTPlanner {
public:
    static constexpr size_t DEFAULT_MAX_CACHED_PLANS = 16;

    /**
     * @throws InvalidConfigurationError if maxCachedPlans is zero
     */
    explicit FFTPlanner(size_t maxCachedPlans = DEFAULT_MAX_CACHED_PLANS);

    /**
     * Get (or build) the forward plan for a length
     * @throws InvalidBufferLengthError if length is zero
     */
    std::shared_ptr<const FFTPlan> planForward(size_t length);

    size_t getCachedPlanCount() const { return plans_.size(); }
    size_t getMaxCachedPlans() const { return maxCachedPlans_; }

    /**
     * Drop every cached plan
     */
    void clear() { plans_.clear(); }

private:
    struct CachedPlan {
        std::shared_ptr<const FFTPlan> plan;
        uint64_t lastUse;
    };

    void evictLeastRecentlyUsed();

    size_t maxCachedPlans_;
    uint64_t useCounter_;
    std::unordered_map<size_t, CachedPlan> plans_;
};

} // namespace apollo::core::dsp
