#include <gtest/gtest.h>
#include <torch/torch.h>
#include <stdexcept>
#include "offrl/rollout.hpp"

using namespace offrl::rl;

namespace {
    torch::Tensor S(float v) { return torch::tensor({ v }); }
}

// ============================================================
// n-step 割引和
// ============================================================
TEST(RolloutAccumulatorTest, DiscountedSumOverWindow) {
    RolloutAccumulator acc(3, 0.5f);
    acc.Push(S(0), S(0), 1.0f);
    acc.Push(S(1), S(0), 1.0f);
    acc.Push(S(2), S(0), 1.0f);

    auto t = acc.GetTransition(S(3), false);
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(t->reward, 1.75f);
    EXPECT_FLOAT_EQ(t->state.item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(t->next_state.item<float>(), 3.0f);
    EXPECT_FLOAT_EQ(t->mask, 1.0f);
}

TEST(RolloutAccumulatorTest, NotReadyBeforeWindowFills) {
    RolloutAccumulator acc(3, 0.9f);
    acc.Push(S(0), S(0), 1.0f);
    EXPECT_FALSE(acc.GetTransition(S(1), false).has_value());
    acc.Push(S(1), S(0), 1.0f);
    EXPECT_FALSE(acc.GetTransition(S(2), false).has_value());
    acc.Push(S(2), S(0), 1.0f);
    EXPECT_TRUE(acc.GetTransition(S(3), false).has_value());
}

TEST(RolloutAccumulatorTest, WindowSlidesAndTerminalClearsMask) {
    RolloutAccumulator acc(3, 0.5f);
    for (int i = 0; i < 4; ++i)
        acc.Push(S(static_cast<float>(i)), S(0), static_cast<float>(i + 1));

    // 窓は報酬 [2, 3, 4]
    auto t = acc.GetTransition(S(4), true);
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(t->reward, 2.0f + 0.5f * 3.0f + 0.25f * 4.0f);
    EXPECT_FLOAT_EQ(t->state.item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(t->mask, 0.0f);
    EXPECT_EQ(acc.Size(), 3);
}

TEST(RolloutAccumulatorTest, SingleStepIsPlainTransition) {
    RolloutAccumulator acc(1, 0.99f);
    acc.Push(S(5), S(1), 2.5f);
    auto t = acc.GetTransition(S(6), false);
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(t->reward, 2.5f);
    EXPECT_FLOAT_EQ(t->action.item<float>(), 1.0f);
}

TEST(RolloutAccumulatorTest, ResetDropsWindow) {
    RolloutAccumulator acc(2, 0.9f);
    acc.Push(S(0), S(0), 1.0f);
    acc.Push(S(1), S(0), 1.0f);
    acc.Reset();
    EXPECT_EQ(acc.Size(), 0);
    acc.Push(S(2), S(0), 1.0f);
    EXPECT_FALSE(acc.GetTransition(S(3), false).has_value());
}

TEST(RolloutAccumulatorTest, RejectsInvalidArguments) {
    EXPECT_THROW(RolloutAccumulator(0, 0.9f), std::invalid_argument);
    EXPECT_THROW(RolloutAccumulator(3, 1.5f), std::invalid_argument);
    EXPECT_THROW(RolloutAccumulator(3, -0.1f), std::invalid_argument);
}
