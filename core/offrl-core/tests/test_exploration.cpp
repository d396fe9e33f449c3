#include <gtest/gtest.h>
#include <torch/torch.h>
#include <stdexcept>
#include "offrl/exploration.hpp"

using namespace offrl::rl;

// ============================================================
// ε スケジュール：単調非増加かつ下限以上
// ============================================================
TEST(EpsilonScheduleTest, LinearIsMonotoneAndBounded) {
    EpsilonScheduleOptions o;
    o.decay = EpsilonDecay::Linear;
    o.start = 1.0f;
    o.end = 0.1f;
    o.annealing_steps = 100;
    EpsilonSchedule eps(o);

    EXPECT_FLOAT_EQ(eps.Value(), 1.0f);
    float prev = eps.Value();
    for (int i = 0; i < 300; ++i) {
        float v = eps.Step();
        EXPECT_LE(v, prev);
        EXPECT_GE(v, o.end);
        prev = v;
    }
    EXPECT_FLOAT_EQ(eps.Value(), 0.1f);
    EXPECT_EQ(eps.Steps(), 300);
}

TEST(EpsilonScheduleTest, LinearReachesHalfwayValue) {
    EpsilonScheduleOptions o;
    o.start = 1.0f;
    o.end = 0.0f;
    o.annealing_steps = 10;
    EpsilonSchedule eps(o);
    for (int i = 0; i < 5; ++i) eps.Step();
    EXPECT_NEAR(eps.Value(), 0.5f, 1e-6);
}

TEST(EpsilonScheduleTest, ExponentialIsMonotoneAndBounded) {
    EpsilonScheduleOptions o;
    o.decay = EpsilonDecay::Exponential;
    o.start = 1.0f;
    o.end = 0.05f;
    o.factor = 0.9f;
    EpsilonSchedule eps(o);

    float prev = eps.Value();
    for (int i = 0; i < 200; ++i) {
        float v = eps.Step();
        EXPECT_LE(v, prev);
        EXPECT_GE(v, o.end);
        prev = v;
    }
    EXPECT_FLOAT_EQ(eps.Value(), 0.05f);
}

TEST(EpsilonScheduleTest, SetStepsAndRestart) {
    EpsilonScheduleOptions o;
    o.start = 1.0f;
    o.end = 0.0f;
    o.annealing_steps = 4;
    EpsilonSchedule eps(o);

    eps.SetSteps(2);
    EXPECT_NEAR(eps.Value(), 0.5f, 1e-6);
    EXPECT_EQ(eps.Steps(), 2);
    eps.Restart();
    EXPECT_FLOAT_EQ(eps.Value(), 1.0f);
    EXPECT_EQ(eps.Steps(), 0);
    EXPECT_THROW(eps.SetSteps(-1), std::invalid_argument);
}

TEST(EpsilonScheduleTest, RejectsInvalidOptions) {
    EpsilonScheduleOptions o;
    o.start = 1.5f;
    EXPECT_THROW(EpsilonSchedule{ o }, std::invalid_argument);

    o = EpsilonScheduleOptions();
    o.end = 0.8f;
    o.start = 0.5f;
    EXPECT_THROW(EpsilonSchedule{ o }, std::invalid_argument);

    o = EpsilonScheduleOptions();
    o.annealing_steps = 0;
    EXPECT_THROW(EpsilonSchedule{ o }, std::invalid_argument);

    o = EpsilonScheduleOptions();
    o.decay = EpsilonDecay::Exponential;
    o.factor = 0.0f;
    EXPECT_THROW(EpsilonSchedule{ o }, std::invalid_argument);
}

// ============================================================
// ノイズ源
// ============================================================
TEST(NoiseTest, GaussianSigmaAnnealsToMinimum) {
    NoiseOptions o;
    o.dim = 2;
    o.sigma = 0.5f;
    o.sigma_min = 0.1f;
    o.n_step_annealing = 4;
    GaussianNoise noise(o);

    EXPECT_FLOAT_EQ(noise.Sigma(), 0.5f);
    for (int i = 0; i < 10; ++i) {
        auto s = noise.Sample();
        EXPECT_EQ(s.sizes(), torch::IntArrayRef({ 2 }));
    }
    EXPECT_NEAR(noise.Sigma(), 0.1f, 1e-6);
}

TEST(NoiseTest, GaussianSampleBatchShape) {
    NoiseOptions o;
    o.dim = 3;
    GaussianNoise noise(o);
    auto s = noise.SampleBatch(16);
    EXPECT_EQ(s.sizes(), torch::IntArrayRef({ 16, 3 }));
    EXPECT_TRUE(torch::isfinite(s).all().item<bool>());
}

TEST(NoiseTest, SameSeedSameSequence) {
    NoiseOptions o;
    o.dim = 4;
    o.seed = 42;
    GaussianNoise a(o), b(o);
    EXPECT_TRUE(torch::equal(a.Sample(), b.Sample()));
}

TEST(NoiseTest, OUWithoutDiffusionStaysAtMean) {
    NoiseOptions o;
    o.dim = 2;
    o.mean = 0.3f;
    o.sigma = 0.0f;
    OUNoise noise(o);
    for (int i = 0; i < 5; ++i) {
        auto s = noise.Sample();
        EXPECT_TRUE(torch::allclose(s, torch::full({ 2 }, 0.3f)));
    }
}

TEST(NoiseTest, OUResetReturnsToMean) {
    NoiseOptions o;
    o.dim = 1;
    o.mean = 0.5f;
    o.sigma = 1.0f;
    o.theta = 0.0f;     // ドリフトなし：ランダムウォーク
    o.dt = 1.0f;
    o.seed = 3;
    OUNoise a(o), b(o);

    torch::Tensor last;
    for (int i = 0; i < 20; ++i) {
        a.Sample();
        last = b.Sample();
    }
    a.Reset();
    // 同じ乱数列：a は mean から、b は直前の状態から1歩進む
    auto x = a.Sample()[0].item<float>();
    auto y = b.Sample()[0].item<float>();
    EXPECT_NEAR(x - o.mean, y - last[0].item<float>(), 1e-4);
}

TEST(NoiseTest, FactoryRejectsUnknownType) {
    NoiseOptions o;
    EXPECT_NE(MakeNoise("ou", o), nullptr);
    EXPECT_NE(MakeNoise("gaussian", o), nullptr);
    EXPECT_NE(MakeNoise("normal", o), nullptr);
    EXPECT_THROW(MakeNoise("pink", o), std::invalid_argument);

    o.dim = 0;
    EXPECT_THROW(MakeNoise("gaussian", o), std::invalid_argument);
}
