#include <gtest/gtest.h>
#include <torch/torch.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "offrl/replay_memory.hpp"

using namespace offrl::rl;

// ============================================================
// テスト前初期化
// ============================================================
class ReplayMemoryTest : public ::testing::Test {
protected:
    static ReplayMemoryOptions MakeOptions(int64_t capacity, bool combined) {
        ReplayMemoryOptions o;
        o.capacity = capacity;
        o.state_shape = { 2 };
        o.action_shape = { 1 };
        o.combined = combined;
        o.seed = 7;
        return o;
    }

    // state = (i, -i), action = i, reward = i
    static void PushSeq(ReplayMemory& memory, int from, int to) {
        for (int i = from; i < to; ++i) {
            float v = static_cast<float>(i);
            memory.Push(torch::tensor({ v, -v }), torch::tensor({ v }), v,
                torch::tensor({ v + 1.0f, -v - 1.0f }), false);
        }
    }
};

// ============================================================
// 容量超過時の保持内容
// ============================================================
TEST_F(ReplayMemoryTest, KeepsMostRecentCapacityTransitions) {
    ReplayMemory memory(MakeOptions(5, false));
    PushSeq(memory, 1, 11);
    ASSERT_EQ(memory.Size(), 5);

    auto batch = memory.Gather({ 0, 1, 2, 3, 4 });
    for (int i = 0; i < 5; ++i) {
        EXPECT_FLOAT_EQ(batch.state[i][0].item<float>(), static_cast<float>(6 + i));
        EXPECT_FLOAT_EQ(batch.reward[i][0].item<float>(), static_cast<float>(6 + i));
        EXPECT_FLOAT_EQ(batch.next_state[i][0].item<float>(), static_cast<float>(7 + i));
    }
}

// ============================================================
// バッチ形状：全フィールドの先頭次元 == batch_size
// ============================================================
TEST_F(ReplayMemoryTest, SampleLeadingDimensionEqualsBatchSize) {
    ReplayMemory memory(MakeOptions(100, false));
    PushSeq(memory, 0, 3);

    for (int64_t k : { 1, 7, 64 }) {
        auto batch = memory.Sample(k);
        EXPECT_EQ(batch.Size(), k);
        EXPECT_EQ(batch.state.sizes(), torch::IntArrayRef({ k, 2 }));
        EXPECT_EQ(batch.action.sizes(), torch::IntArrayRef({ k, 1 }));
        EXPECT_EQ(batch.reward.sizes(), torch::IntArrayRef({ k, 1 }));
        EXPECT_EQ(batch.next_state.sizes(), torch::IntArrayRef({ k, 2 }));
        EXPECT_EQ(batch.mask.sizes(), torch::IntArrayRef({ k, 1 }));
        EXPECT_EQ(batch.indices.numel(), k);
        EXPECT_LT(batch.indices.max().item<int64_t>(), 3);
    }
}

TEST_F(ReplayMemoryTest, TerminalMapsToZeroMask) {
    ReplayMemory memory(MakeOptions(4, false));
    memory.Push(torch::zeros({ 2 }), torch::zeros({ 1 }), 1.0f, torch::zeros({ 2 }), true);
    memory.Push(torch::zeros({ 2 }), torch::zeros({ 1 }), 1.0f, torch::zeros({ 2 }), false);
    auto batch = memory.Gather({ 0, 1 });
    EXPECT_FLOAT_EQ(batch.mask[0][0].item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(batch.mask[1][0].item<float>(), 1.0f);
}

// ============================================================
// Combined Experience Replay
// ============================================================
TEST_F(ReplayMemoryTest, CombinedContainsNewestExactlyOnce) {
    ReplayMemory memory(MakeOptions(50, true));
    PushSeq(memory, 0, 20);

    for (int trial = 0; trial < 100; ++trial) {
        auto batch = memory.Sample(16);
        EXPECT_EQ(batch.Size(), 16);
        EXPECT_EQ((batch.indices == 19).sum().item<int64_t>(), 1);
        EXPECT_EQ((batch.state.select(1, 0) == 19.0f).sum().item<int64_t>(), 1);
    }
}

TEST_F(ReplayMemoryTest, CombinedAfterWrapAround) {
    ReplayMemory memory(MakeOptions(10, true));
    PushSeq(memory, 0, 23);
    ASSERT_EQ(memory.Size(), 10);

    for (int trial = 0; trial < 50; ++trial) {
        auto batch = memory.Sample(8);
        EXPECT_EQ((batch.state.select(1, 0) == 22.0f).sum().item<int64_t>(), 1);
        // 最古は 13
        EXPECT_GE(batch.state.select(1, 0).min().item<float>(), 13.0f);
    }
}

TEST_F(ReplayMemoryTest, CombinedRequiresTwoTransitions) {
    ReplayMemory memory(MakeOptions(10, true));
    PushSeq(memory, 0, 1);
    EXPECT_THROW(memory.Sample(4), std::logic_error);
    PushSeq(memory, 1, 2);
    EXPECT_NO_THROW(memory.Sample(4));
}

// ============================================================
// 異常系
// ============================================================
TEST_F(ReplayMemoryTest, SampleFromEmptyThrows) {
    ReplayMemory memory(MakeOptions(10, false));
    EXPECT_THROW(memory.Sample(4), std::logic_error);
    PushSeq(memory, 0, 1);
    EXPECT_THROW(memory.Sample(0), std::invalid_argument);
}

TEST_F(ReplayMemoryTest, RejectsInvalidConstruction) {
    EXPECT_THROW(ReplayMemory{ MakeOptions(1, true) }, std::invalid_argument);
    EXPECT_THROW(ReplayMemory{ MakeOptions(0, false) }, std::invalid_argument);
    auto o = MakeOptions(10, false);
    o.state_shape.clear();
    EXPECT_THROW(ReplayMemory{ o }, std::invalid_argument);
}

TEST_F(ReplayMemoryTest, RejectsInvalidTransitionWithoutPartialWrite) {
    ReplayMemory memory(MakeOptions(10, false));
    PushSeq(memory, 0, 2);

    Transition bad_mask{ torch::zeros({ 2 }), torch::zeros({ 1 }), 1.0f, torch::zeros({ 2 }), 0.5f };
    EXPECT_THROW(memory.Push(bad_mask), std::invalid_argument);

    Transition bad_reward{ torch::zeros({ 2 }), torch::zeros({ 1 }),
        std::numeric_limits<float>::quiet_NaN(), torch::zeros({ 2 }), 1.0f };
    EXPECT_THROW(memory.Push(bad_reward), std::invalid_argument);

    Transition bad_next{ torch::zeros({ 2 }), torch::zeros({ 1 }), 1.0f, torch::zeros({ 3 }), 1.0f };
    EXPECT_THROW(memory.Push(bad_next), std::invalid_argument);

    EXPECT_EQ(memory.Size(), 2);
    // 既存内容も壊れていない
    auto batch = memory.Gather({ 0, 1 });
    EXPECT_FLOAT_EQ(batch.state[1][0].item<float>(), 1.0f);
}

TEST_F(ReplayMemoryTest, ResetClearsContents) {
    ReplayMemory memory(MakeOptions(10, false));
    PushSeq(memory, 0, 5);
    memory.Reset();
    EXPECT_EQ(memory.Size(), 0);
    EXPECT_THROW(memory.Sample(1), std::logic_error);
}
