// File: tests/memory/decay_functions_test.cpp
#include "memory/decay_functions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

namespace engram {
namespace {

Timestamp::Duration Days(int days) {
    return std::chrono::hours(24 * days);
}

// ============================================================================
// InverseSquareDecay Tests
// ============================================================================

TEST(InverseSquareDecayTest, HalfStrengthAtHalfLife) {
    InverseSquareDecay decay(30.0);
    EXPECT_NEAR(0.4f, decay.ApplyDecay(0.8f, Days(30)), 1e-5f);
}

TEST(InverseSquareDecayTest, OldImportantRecord) {
    InverseSquareDecay decay(30.0);

    // 0.9 / (1 + (100/30)^2)
    float expected = static_cast<float>(0.9 / (1.0 + std::pow(100.0 / 30.0, 2.0)));
    EXPECT_NEAR(expected, decay.ApplyDecay(0.9f, Days(100)), 1e-5f);
    EXPECT_NEAR(0.0749f, decay.ApplyDecay(0.9f, Days(100)), 1e-3f);
}

TEST(InverseSquareDecayTest, MonotonicInAge) {
    InverseSquareDecay decay(7.0);
    float previous = decay.ApplyDecay(1.0f, Days(0));
    EXPECT_FLOAT_EQ(1.0f, previous);

    for (int day = 1; day <= 365; day += 7) {
        float current = decay.ApplyDecay(1.0f, Days(day));
        EXPECT_LE(current, previous);
        previous = current;
    }
    EXPECT_GT(previous, 0.0f);
}

TEST(InverseSquareDecayTest, NegativeAgeTreatedAsZero) {
    InverseSquareDecay decay(30.0);
    EXPECT_FLOAT_EQ(0.6f, decay.ApplyDecay(0.6f, -Days(3)));
}

TEST(InverseSquareDecayTest, ZeroStrengthOrHalfLife) {
    EXPECT_FLOAT_EQ(0.0f, InverseSquareDecay(30.0).ApplyDecay(0.0f, Days(1)));
    EXPECT_FLOAT_EQ(0.0f, InverseSquareDecay(0.0).ApplyDecay(1.0f, Days(1)));
}

// ============================================================================
// ExponentialDecay Tests
// ============================================================================

TEST(ExponentialDecayTest, FollowsExponentialCurve) {
    ExponentialDecay decay(10.0);
    EXPECT_NEAR(std::exp(-1.0f), decay.ApplyDecay(1.0f, Days(10)), 1e-5f);
}

TEST(ExponentialDecayTest, ForgetsOldRecordsFasterThanInverseSquare) {
    ExponentialDecay exponential(30.0);
    InverseSquareDecay inverse_square(30.0);
    EXPECT_LT(exponential.ApplyDecay(1.0f, Days(200)), inverse_square.ApplyDecay(1.0f, Days(200)));
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(DecayFactoryTest, CreatesByName) {
    auto inverse = CreateDecayFunction("inverse_square", 14.0);
    ASSERT_NE(nullptr, inverse);
    EXPECT_STREQ("InverseSquareDecay", inverse->GetName());
    EXPECT_DOUBLE_EQ(14.0, inverse->GetHalfLifeDays());

    auto exponential = CreateDecayFunction("exponential", 3.0);
    ASSERT_NE(nullptr, exponential);
    EXPECT_STREQ("ExponentialDecay", exponential->GetName());

    EXPECT_EQ(nullptr, CreateDecayFunction("linear", 3.0));
}

TEST(DecayFactoryTest, CloneKeepsParameters) {
    auto original = CreateDecayFunction("exponential", 5.0);
    auto clone = original->Clone();
    EXPECT_DOUBLE_EQ(5.0, clone->GetHalfLifeDays());
    EXPECT_FLOAT_EQ(original->ApplyDecay(0.7f, Days(4)), clone->ApplyDecay(0.7f, Days(4)));
}

} // namespace
} // namespace engram
