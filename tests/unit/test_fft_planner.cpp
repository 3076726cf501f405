#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <vector>
#include <complex>
#include <cmath>
#include <random>

#include "core/dsp/fft_planner.hpp"
#include "core/errors.hpp"

using namespace apollo::core;
using namespace apollo::core::dsp;
using namespace testing;

namespace {
constexpr double kPi = 3.14159265358979323846;
}

class FFTPlannerTest : public ::testing::Test {
protected:
    static std::vector<std::complex<float>> randomSignal(size_t length, unsigned seed) {
        std::mt19937 gen(seed);
        std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

        std::vector<std::complex<float>> signal(length);
        for (auto& value : signal) {
            value = std::complex<float>(dist(gen), dist(gen));
        }
        return signal;
    }

    // Direct O(N^2) DFT in double precision as reference
    static std::vector<std::complex<double>> referenceDFT(const std::vector<std::complex<float>>& input) {
        const size_t n = input.size();
        std::vector<std::complex<double>> output(n);
        for (size_t k = 0; k < n; ++k) {
            std::complex<double> sum(0.0, 0.0);
            for (size_t i = 0; i < n; ++i) {
                double angle = -2.0 * kPi * static_cast<double>((k * i) % n) / static_cast<double>(n);
                sum += std::complex<double>(input[i]) * std::complex<double>(std::cos(angle), std::sin(angle));
            }
            output[k] = sum;
        }
        return output;
    }

    static void expectMatchesReference(size_t length, unsigned seed) {
        FFTPlan plan(length);
        auto signal = randomSignal(length, seed);
        auto expected = referenceDFT(signal);

        std::vector<std::complex<float>> scratch(plan.getScratchLength());
        plan.process(signal.data(), scratch.empty() ? nullptr : scratch.data());

        // Error grows roughly with sqrt(N) * log(N) in single precision
        const double tolerance = 1e-4 * std::sqrt(static_cast<double>(length)) * std::log2(2.0 * length);
        for (size_t k = 0; k < length; ++k) {
            EXPECT_NEAR(signal[k].real(), expected[k].real(), tolerance) << "bin " << k << " of " << length;
            EXPECT_NEAR(signal[k].imag(), expected[k].imag(), tolerance) << "bin " << k << " of " << length;
        }
    }

    FFTPlanner planner_;
};

// Test 1: Power-of-two lengths use radix-2
TEST_F(FFTPlannerTest, PowerOfTwoMatchesDirectDFT) {
    for (size_t length : {1u, 2u, 4u, 8u, 64u, 1024u}) {
        FFTPlan plan(length);
        EXPECT_FALSE(plan.usesBluestein()) << "length " << length;
        EXPECT_EQ(plan.getScratchLength(), 0u);
        expectMatchesReference(length, static_cast<unsigned>(length));
    }
}

// Test 2: Arbitrary lengths use Bluestein
TEST_F(FFTPlannerTest, ArbitraryLengthMatchesDirectDFT) {
    for (size_t length : {3u, 5u, 6u, 7u, 12u, 100u, 441u, 1000u}) {
        FFTPlan plan(length);
        EXPECT_TRUE(plan.usesBluestein()) << "length " << length;
        EXPECT_GE(plan.getScratchLength(), 2 * length - 1);
        expectMatchesReference(length, static_cast<unsigned>(length) + 17u);
    }
}

// Test 3: Unnormalized forward transform of a constant
TEST_F(FFTPlannerTest, ConstantSignalConcentratesInDC) {
    const size_t length = 16;
    FFTPlan plan(length);
    std::vector<std::complex<float>> data(length, std::complex<float>(1.0f, 0.0f));

    plan.process(data.data(), nullptr);

    EXPECT_NEAR(data[0].real(), 16.0f, 1e-5f);
    EXPECT_NEAR(data[0].imag(), 0.0f, 1e-5f);
    for (size_t k = 1; k < length; ++k) {
        EXPECT_NEAR(std::abs(data[k]), 0.0f, 1e-5f) << "bin " << k;
    }
}

// Test 4: Zero input stays exactly zero
TEST_F(FFTPlannerTest, ZeroSignalStaysZero) {
    for (size_t length : {8u, 9u}) {
        FFTPlan plan(length);
        std::vector<std::complex<float>> data(length);
        std::vector<std::complex<float>> scratch(plan.getScratchLength());

        plan.process(data.data(), scratch.empty() ? nullptr : scratch.data());

        for (const auto& value : data) {
            EXPECT_EQ(value, std::complex<float>(0.0f, 0.0f));
        }
    }
}

// Test 5: Invalid lengths and missing scratch
TEST_F(FFTPlannerTest, ZeroLengthThrows) {
    EXPECT_THROW(FFTPlan{0}, InvalidBufferLengthError);
    EXPECT_THROW(planner_.planForward(0), InvalidBufferLengthError);
    EXPECT_EQ(planner_.getCachedPlanCount(), 0u);
}

TEST_F(FFTPlannerTest, BluesteinWithoutScratchThrows) {
    FFTPlan plan(6);
    std::vector<std::complex<float>> data(6);

    EXPECT_THROW(plan.process(data.data(), nullptr), InvalidBufferLengthError);
}

// Test 6: Plan cache
TEST_F(FFTPlannerTest, SameLengthReusesPlan) {
    auto first = planner_.planForward(512);
    auto second = planner_.planForward(512);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(planner_.getCachedPlanCount(), 1u);
}

TEST_F(FFTPlannerTest, NewLengthBuildsNewPlan) {
    auto first = planner_.planForward(512);
    auto second = planner_.planForward(480);

    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(first->getLength(), 512u);
    EXPECT_EQ(second->getLength(), 480u);
    EXPECT_EQ(planner_.getCachedPlanCount(), 2u);

    planner_.clear();
    EXPECT_EQ(planner_.getCachedPlanCount(), 0u);
    EXPECT_EQ(first->getLength(), 512u) << "Outstanding plans stay valid after clear()";
}

TEST_F(FFTPlannerTest, FullCacheEvictsLeastRecentlyUsed) {
    FFTPlanner planner(2);
    EXPECT_EQ(planner.getMaxCachedPlans(), 2u);

    auto plan8 = planner.planForward(8);
    auto plan16 = planner.planForward(16);
    EXPECT_EQ(planner.planForward(8).get(), plan8.get());

    // 16 is now the least recently requested length
    auto plan32 = planner.planForward(32);
    EXPECT_EQ(planner.getCachedPlanCount(), 2u);
    EXPECT_EQ(planner.planForward(8).get(), plan8.get());
    EXPECT_EQ(planner.planForward(32).get(), plan32.get());

    auto rebuilt16 = planner.planForward(16);
    EXPECT_NE(rebuilt16.get(), plan16.get());
    EXPECT_EQ(plan16->getLength(), 16u) << "Evicted plans stay valid for their holders";
    EXPECT_EQ(planner.getCachedPlanCount(), 2u);
}

TEST_F(FFTPlannerTest, ManyBlockLengthsStayWithinBound) {
    for (size_t length = 1; length <= 100; ++length) {
        planner_.planForward(length);
    }
    EXPECT_EQ(planner_.getCachedPlanCount(), FFTPlanner::DEFAULT_MAX_CACHED_PLANS);
}

TEST_F(FFTPlannerTest, ZeroCapacityThrows) {
    EXPECT_THROW(FFTPlanner{0}, InvalidConfigurationError);
}

TEST_F(FFTPlannerTest, PowerOfTwoHelpers) {
    EXPECT_TRUE(FFTPlan::isPowerOfTwo(1));
    EXPECT_TRUE(FFTPlan::isPowerOfTwo(1024));
    EXPECT_FALSE(FFTPlan::isPowerOfTwo(0));
    EXPECT_FALSE(FFTPlan::isPowerOfTwo(1000));
    EXPECT_EQ(FFTPlan::nextPowerOfTwo(1000), 1024u);
    EXPECT_EQ(FFTPlan::nextPowerOfTwo(1024), 1024u);
    EXPECT_EQ(FFTPlan::nextPowerOfTwo(3), 4u);
}
