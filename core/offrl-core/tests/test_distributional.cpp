#include <gtest/gtest.h>
#include <torch/torch.h>
#include <stdexcept>
#include "offrl/distributional.hpp"

using namespace offrl::rl;

// ============================================================
// 射影後も確率質量は保存される
// ============================================================
TEST(CategoricalProjectorTest, PreservesProbabilityMass) {
    torch::manual_seed(0);
    CategoricalProjector projector(51, -10.0f, 10.0f);

    const int64_t B = 64;
    auto probs = torch::softmax(torch::randn({ B, 51 }), 1);
    auto reward = torch::randn({ B, 1 }) * 5.0f;
    auto mask = (torch::rand({ B, 1 }) > 0.3f).to(torch::kFloat);

    auto projected = projector.Project(probs, reward, mask, 0.99f);
    ASSERT_EQ(projected.sizes(), torch::IntArrayRef({ B, 51 }));
    EXPECT_TRUE(torch::allclose(projected.sum(1), torch::ones({ B }), 1e-5, 1e-5));
    EXPECT_GE(projected.min().item<float>(), 0.0f);
}

// ============================================================
// 格子点にちょうど乗る場合は1つの atom に全質量
// ============================================================
TEST(CategoricalProjectorTest, ExactGridLanding) {
    CategoricalProjector projector(5, 0.0f, 4.0f);
    EXPECT_FLOAT_EQ(projector.DeltaZ(), 1.0f);

    auto probs = torch::zeros({ 1, 5 });
    probs[0][2] = 1.0f;
    auto projected = projector.Project(probs, torch::tensor({ { 1.0f } }), torch::ones({ 1, 1 }), 1.0f);

    auto expected = torch::zeros({ 1, 5 });
    expected[0][3] = 1.0f;
    EXPECT_TRUE(torch::allclose(projected, expected, 1e-6, 1e-6));
}

TEST(CategoricalProjectorTest, TerminalSplitsBetweenNeighbours) {
    CategoricalProjector projector(5, 0.0f, 4.0f);
    auto probs = torch::full({ 1, 5 }, 0.2f);

    // 終端：全 atom が reward=2.5 に集まり atom 2/3 に半分ずつ
    auto projected = projector.Project(probs, torch::tensor({ { 2.5f } }), torch::zeros({ 1, 1 }), 0.99f);
    EXPECT_NEAR(projected[0][2].item<float>(), 0.5f, 1e-6);
    EXPECT_NEAR(projected[0][3].item<float>(), 0.5f, 1e-6);
    EXPECT_NEAR(projected.sum().item<float>(), 1.0f, 1e-6);
}

TEST(CategoricalProjectorTest, ClampsToSupportEdges) {
    CategoricalProjector projector(11, -5.0f, 5.0f);
    auto probs = torch::softmax(torch::randn({ 2, 11 }), 1);
    auto reward = torch::tensor({ { 100.0f }, { -100.0f } });
    auto projected = projector.Project(probs, reward, torch::ones({ 2, 1 }), 0.9f);

    EXPECT_NEAR(projected[0][10].item<float>(), 1.0f, 1e-5);
    EXPECT_NEAR(projected[1][0].item<float>(), 1.0f, 1e-5);
}

// ============================================================
// 異常系
// ============================================================
TEST(CategoricalProjectorTest, RejectsInvalidArguments) {
    EXPECT_THROW(CategoricalProjector(1, 0.0f, 1.0f), std::invalid_argument);
    EXPECT_THROW(CategoricalProjector(51, 1.0f, 1.0f), std::invalid_argument);
    EXPECT_THROW(CategoricalProjector(51, 2.0f, -2.0f), std::invalid_argument);

    CategoricalProjector projector(5, 0.0f, 4.0f);
    EXPECT_THROW(projector.Project(torch::zeros({ 2, 4 }), torch::zeros({ 2, 1 }), torch::ones({ 2, 1 }), 0.9f),
        std::invalid_argument);
    EXPECT_THROW(projector.Project(torch::zeros({ 2, 5 }), torch::zeros({ 3, 1 }), torch::ones({ 2, 1 }), 0.9f),
        std::invalid_argument);
}

TEST(CategoricalProjectorTest, SupportIsEvenlySpaced) {
    CategoricalProjector projector(51, 0.0f, 200.0f);
    const auto& z = projector.Support();
    ASSERT_EQ(z.numel(), 51);
    EXPECT_FLOAT_EQ(z[0].item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(z[50].item<float>(), 200.0f);
    EXPECT_NEAR(z[1].item<float>() - z[0].item<float>(), projector.DeltaZ(), 1e-4);
}
