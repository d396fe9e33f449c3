#include <gtest/gtest.h>
#include <torch/torch.h>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "offrl/learner.hpp"

using namespace offrl::rl;

// ============================================================
// テスト前初期化
// ============================================================
class LearnerTest : public ::testing::TestWithParam<AgentType> {
protected:
    static constexpr int64_t kStateDim = 3;
    static constexpr int64_t kBatch = 8;

    static LearnerSpaces MakeSpaces(AgentType type) {
        LearnerSpaces spaces;
        spaces.state_dim = kStateDim;
        spaces.action.discrete = IsDiscrete(type);
        spaces.action.n = IsDiscrete(type) ? 4 : 2;
        spaces.action.low = -2.0f;
        spaces.action.high = 2.0f;
        return spaces;
    }

    static LearnerParam MakeParam() {
        LearnerParam p;
        p.hidden = "16,16";
        p.support_dim = 11;
        p.v_min = -10.0f;
        p.v_max = 10.0f;
        p.critic_grad_norm = 10.0f;
        return p;
    }

    static Batch MakeBatch(const LearnerSpaces& spaces) {
        Batch b;
        b.state = torch::randn({ kBatch, kStateDim });
        b.next_state = torch::randn({ kBatch, kStateDim });
        if (spaces.action.discrete)
            b.action = torch::randint(0, spaces.action.n, { kBatch, 1 }).to(torch::kFloat);
        else
            b.action = torch::rand({ kBatch, spaces.action.n }) * 4.0f - 2.0f;
        b.reward = torch::randn({ kBatch, 1 });
        b.mask = (torch::rand({ kBatch, 1 }) > 0.2f).to(torch::kFloat);
        b.indices = torch::arange(kBatch);
        return b;
    }

    static void ApplyAll(const std::vector<LossTerm>& terms) {
        for (const auto& term : terms) {
            ASSERT_NE(term.optimizer, nullptr) << term.tag;
            ASSERT_EQ(term.loss.numel(), 1) << term.tag;
            EXPECT_TRUE(std::isfinite(term.loss.item<float>())) << term.tag;
            term.optimizer->zero_grad();
            term.loss.backward();
            term.optimizer->step();
        }
    }
};

// ============================================================
// 全種別：行動選択・ターゲット・損失が一通り回る
// ============================================================
TEST_P(LearnerTest, BuildsAndRunsOneUpdate) {
    torch::manual_seed(0);
    const auto type = GetParam();
    const auto spaces = MakeSpaces(type);
    auto learner = MakeLearner(type, spaces, MakeParam());
    ASSERT_NE(learner, nullptr);
    EXPECT_EQ(learner->Type(), type);

    auto state = torch::randn({ kStateDim });
    for (bool explore : { true, false }) {
        auto action = learner->SelectAction(state, explore);
        if (spaces.action.discrete) {
            ASSERT_EQ(action.numel(), 1);
            EXPECT_EQ(action.scalar_type(), torch::kLong);
            EXPECT_GE(action.item<int64_t>(), 0);
            EXPECT_LT(action.item<int64_t>(), spaces.action.n);
        } else {
            ASSERT_EQ(action.sizes(), torch::IntArrayRef({ spaces.action.n }));
            EXPECT_GE(action.min().item<float>(), spaces.action.low);
            EXPECT_LE(action.max().item<float>(), spaces.action.high);
        }
    }

    auto batch = MakeBatch(spaces);
    auto target = learner->ComputeTarget(batch, 0.99f);
    EXPECT_FALSE(target.requires_grad());
    EXPECT_EQ(target.size(0), kBatch);
    EXPECT_TRUE(torch::isfinite(target).all().item<bool>());

    auto critic = learner->CriticLosses(batch, target);
    EXPECT_FALSE(critic.empty());
    ApplyAll(critic);

    auto actor = learner->ActorLosses(batch);
    EXPECT_EQ(actor.empty(), !learner->HasActor());
    ApplyAll(actor);
    learner->OnActorStepped();

    EXPECT_FALSE(learner->TargetPairs().empty());
    for (auto& pair : learner->TargetPairs()) {
        EXPECT_NE(pair.live, nullptr);
        EXPECT_NE(pair.target, nullptr);
        EXPECT_NE(pair.live, pair.target);
    }
}

INSTANTIATE_TEST_SUITE_P(AllAgents, LearnerTest,
    ::testing::Values(AgentType::DQN, AgentType::DoubleDQN, AgentType::CategoricalDQN, AgentType::QuantileDQN,
        AgentType::DDPG, AgentType::TD3, AgentType::SAC, AgentType::QuantileDDPG),
    [](const ::testing::TestParamInfo<AgentType>& info) { return ToString(info.param); });

// ============================================================
// 個別の性質
// ============================================================
TEST(LearnerPropertyTest, DqnTerminalTargetIsReward) {
    LearnerSpaces spaces;
    spaces.state_dim = 2;
    spaces.action.discrete = true;
    spaces.action.n = 3;
    auto learner = MakeLearner(AgentType::DQN, spaces, LearnerParam());

    Batch b;
    b.state = torch::randn({ 4, 2 });
    b.next_state = torch::randn({ 4, 2 });
    b.action = torch::zeros({ 4, 1 });
    b.reward = torch::tensor({ { 1.0f }, { -2.0f }, { 0.5f }, { 3.0f } });
    b.mask = torch::zeros({ 4, 1 });

    auto target = learner->ComputeTarget(b, 0.9f);
    ASSERT_EQ(target.sizes(), torch::IntArrayRef({ 4, 1 }));
    EXPECT_TRUE(torch::allclose(target, b.reward));
}

TEST(LearnerPropertyTest, CategoricalTargetIsDistribution) {
    LearnerSpaces spaces;
    spaces.state_dim = 2;
    spaces.action.discrete = true;
    spaces.action.n = 2;
    LearnerParam p;
    p.hidden = "8";
    p.support_dim = 21;
    p.v_min = -5.0f;
    p.v_max = 5.0f;
    auto learner = MakeLearner(AgentType::CategoricalDQN, spaces, p);

    Batch b;
    b.state = torch::randn({ 6, 2 });
    b.next_state = torch::randn({ 6, 2 });
    b.action = torch::ones({ 6, 1 });
    b.reward = torch::randn({ 6, 1 });
    b.mask = torch::ones({ 6, 1 });

    auto target = learner->ComputeTarget(b, 0.99f);
    ASSERT_EQ(target.sizes(), torch::IntArrayRef({ 6, 21 }));
    EXPECT_TRUE(torch::allclose(target.sum(1), torch::ones({ 6 }), 1e-5, 1e-5));
}

TEST(LearnerPropertyTest, RejectsMismatchedActionSpace) {
    LearnerSpaces discrete;
    discrete.state_dim = 2;
    discrete.action.discrete = true;
    discrete.action.n = 2;

    LearnerSpaces continuous = discrete;
    continuous.action.discrete = false;

    EXPECT_THROW(MakeLearner(AgentType::DDPG, discrete, LearnerParam()), std::invalid_argument);
    EXPECT_THROW(MakeLearner(AgentType::SAC, discrete, LearnerParam()), std::invalid_argument);
    EXPECT_THROW(MakeLearner(AgentType::DQN, continuous, LearnerParam()), std::invalid_argument);
    EXPECT_THROW(MakeLearner(AgentType::CategoricalDQN, continuous, LearnerParam()), std::invalid_argument);

    LearnerSpaces empty = discrete;
    empty.state_dim = 0;
    EXPECT_THROW(MakeLearner(AgentType::DQN, empty, LearnerParam()), std::invalid_argument);
}

TEST(LearnerPropertyTest, AgentTypeNames) {
    EXPECT_EQ(ParseAgentType("td3"), AgentType::TD3);
    EXPECT_EQ(ParseAgentType("categorical_dqn"), AgentType::CategoricalDQN);
    EXPECT_EQ(ToString(AgentType::QuantileDDPG), "quantile_ddpg");
    EXPECT_TRUE(IsDiscrete(AgentType::QuantileDQN));
    EXPECT_FALSE(IsDiscrete(AgentType::SAC));
    EXPECT_THROW(ParseAgentType("ppo"), std::invalid_argument);
}
