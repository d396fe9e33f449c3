#include <gtest/gtest.h>
#include <torch/torch.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include "offrl/agent.hpp"
#include "offrl/checkpoint.hpp"
#include "learners/learners.hpp"

using namespace offrl;
using namespace offrl::rl;
namespace fs = std::filesystem;

// ============================================================
// テスト前初期化（テストごとに一時ディレクトリ）
// ============================================================
class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("offrl_ckpt_") + info->name());
        fs::remove_all(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::unique_ptr<OffPolicyAgent> MakeAgent(int64_t seed, bool state_normalization = true) {
        torch::manual_seed(static_cast<uint64_t>(seed));
        OffPolicyAgent::Param p;
        p.warm_up_steps = 4;
        p.batch_size = 4;
        p.memory_capacity = 64;
        p.state_normalization = state_normalization;
        p.epsilon_annealing_steps = 100;
        p.seed = seed;

        LearnerSpaces spaces;
        spaces.state_dim = 2;
        spaces.action.discrete = true;
        spaces.action.n = 2;
        LearnerParam lp;
        lp.hidden = "8";
        lp.seed = seed;

        return std::make_unique<OffPolicyAgent>(p, MakeLearner(AgentType::DQN, spaces, lp),
            std::vector<int64_t>{ 2 }, spaces.action);
    }

    // 温度自動調整つき SAC（1 次元連続行動）
    std::unique_ptr<OffPolicyAgent> MakeSacAgent(int64_t seed) {
        torch::manual_seed(static_cast<uint64_t>(seed));
        OffPolicyAgent::Param p;
        p.warm_up_steps = 4;
        p.batch_size = 4;
        p.memory_capacity = 64;
        p.seed = seed;

        LearnerSpaces spaces;
        spaces.state_dim = 2;
        spaces.action.discrete = false;
        spaces.action.n = 1;
        spaces.action.low = -2.0f;
        spaces.action.high = 2.0f;
        LearnerParam lp;
        lp.hidden = "8";
        lp.alpha_tuning = true;
        lp.alpha_learning_rate = 1e-2f;
        lp.seed = seed;

        return std::make_unique<OffPolicyAgent>(p, MakeLearner(AgentType::SAC, spaces, lp),
            std::vector<int64_t>{ 2 }, spaces.action);
    }

    static void Run(OffPolicyAgent& agent, int steps) {
        for (int i = 0; i < steps; ++i) {
            Experience e;
            e.state = torch::tensor({ static_cast<float>(i), 2.0f * i });
            e.action = agent.Act(e.state, true).to(torch::kFloat);
            e.response = EnvResponse{ torch::tensor({ i + 1.0f, 2.0f * i + 2.0f }), 1.0f, false, false };
            agent.Step(e);
        }
    }

    fs::path dir;
};

// ============================================================
// CheckpointStore：最新ステップを選ぶ
// ============================================================
TEST_F(CheckpointTest, StoreLoadsLatestStep) {
    CheckpointStore store(dir);
    EXPECT_FALSE(store.LatestStep().has_value());
    torch::serialize::InputArchive empty;
    EXPECT_FALSE(store.Load(empty));

    for (int64_t step : { 5, 120, 12 }) {
        torch::serialize::OutputArchive out;
        out.write("value", torch::tensor(static_cast<float>(step)), /*is_buffer=*/true);
        auto path = store.Save(out, step);
        EXPECT_TRUE(fs::exists(path));
        EXPECT_EQ(path, store.PathFor(step));
    }
    // 一時ファイルは残らない
    for (const auto& entry : fs::directory_iterator(dir))
        EXPECT_NE(entry.path().extension(), ".tmp");

    ASSERT_TRUE(store.LatestStep().has_value());
    EXPECT_EQ(*store.LatestStep(), 120);

    torch::serialize::InputArchive in;
    ASSERT_TRUE(store.Load(in));
    torch::Tensor value;
    in.read("value", value, /*is_buffer=*/true);
    EXPECT_FLOAT_EQ(value.item<float>(), 120.0f);
}

TEST_F(CheckpointTest, StoreIgnoresForeignFiles) {
    fs::create_directories(dir);
    { std::ofstream(dir / "checkpoint_abc.pt") << "x"; }
    { std::ofstream(dir / "other_99.pt") << "x"; }
    CheckpointStore store(dir);
    EXPECT_FALSE(store.LatestStep().has_value());
    EXPECT_THROW(CheckpointStore(dir, ""), std::invalid_argument);
}

TEST_F(CheckpointTest, StoreSkipsStepsOutOfRange) {
    fs::create_directories(dir);
    { std::ofstream(dir / "checkpoint_99999999999999999999.pt") << "x"; }
    { std::ofstream(dir / "checkpoint_-3.pt") << "x"; }
    { std::ofstream(dir / "checkpoint_7.pt") << "x"; }
    CheckpointStore store(dir);
    std::optional<int64_t> latest;
    EXPECT_NO_THROW(latest = store.LatestStep());
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(*latest, 7);
}

// ============================================================
// エージェント：重み・正規化統計・カウンタが復元される
// ============================================================
TEST_F(CheckpointTest, AgentRoundTripRestoresState) {
    auto agent = MakeAgent(1);
    for (int i = 0; i < 12; ++i) {
        Experience e;
        e.state = torch::tensor({ static_cast<float>(i), 2.0f * i });
        e.action = agent->Act(e.state, true).to(torch::kFloat);
        e.response = EnvResponse{ torch::tensor({ i + 1.0f, 2.0f * i + 2.0f }), 1.0f, false, false };
        agent->Step(e);
    }
    ASSERT_GT(agent->Updates(), 0);

    CheckpointStore store(dir);
    auto path = agent->Save(store);
    EXPECT_TRUE(fs::exists(path));

    auto restored = MakeAgent(99);
    ASSERT_TRUE(restored->Load(store));

    EXPECT_EQ(restored->EnvSteps(), agent->EnvSteps());
    EXPECT_EQ(restored->Updates(), agent->Updates());
    EXPECT_EQ(restored->PolicyUpdates(), agent->PolicyUpdates());
    EXPECT_FLOAT_EQ(restored->Epsilon(), agent->Epsilon());

    ASSERT_NE(restored->Normalizer(), nullptr);
    EXPECT_TRUE(torch::allclose(restored->Normalizer()->Mean(), agent->Normalizer()->Mean()));
    EXPECT_DOUBLE_EQ(restored->Normalizer()->Count(), agent->Normalizer()->Count());

    auto a = agent->GetLearner().Networks();
    auto b = restored->GetLearner().Networks();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        auto pa = a[i].module->parameters();
        auto pb = b[i].module->parameters();
        ASSERT_EQ(pa.size(), pb.size());
        for (size_t k = 0; k < pa.size(); ++k)
            EXPECT_TRUE(torch::equal(pa[k], pb[k])) << a[i].name;
    }

    // 同じ状態に同じ貪欲行動
    auto state = torch::tensor({ 3.0f, 6.0f });
    EXPECT_EQ(agent->Act(state, false).item<int64_t>(), restored->Act(state, false).item<int64_t>());
}

// ============================================================
// SAC：温度 log_alpha も復元される
// ============================================================
TEST_F(CheckpointTest, SacRoundTripRestoresAlpha) {
    auto agent = MakeSacAgent(3);
    Run(*agent, 16);
    ASSERT_GT(agent->Updates(), 0);

    auto* sac = dynamic_cast<SacLearner*>(&agent->GetLearner());
    ASSERT_NE(sac, nullptr);
    EXPECT_NE(sac->Alpha(), 1.0f);

    CheckpointStore store(dir);
    agent->Save(store);

    auto restored = MakeSacAgent(42);
    auto* restored_sac = dynamic_cast<SacLearner*>(&restored->GetLearner());
    ASSERT_NE(restored_sac, nullptr);
    EXPECT_FLOAT_EQ(restored_sac->Alpha(), 1.0f);

    ASSERT_TRUE(restored->Load(store));
    EXPECT_FLOAT_EQ(restored_sac->Alpha(), sac->Alpha());
    EXPECT_EQ(restored->Updates(), agent->Updates());

    auto state = torch::tensor({ 1.0f, 2.0f });
    EXPECT_TRUE(torch::allclose(agent->Act(state, false), restored->Act(state, false)));
}

// ============================================================
// 正規化統計を持たないチェックポイントは読み込みエラー
// ============================================================
TEST_F(CheckpointTest, MissingNormalizerIsRuntimeError) {
    auto agent = MakeAgent(1, /*state_normalization=*/false);
    Run(*agent, 6);
    CheckpointStore store(dir);
    const auto path = agent->Save(store);

    auto restored = MakeAgent(2, /*state_normalization=*/true);
    try {
        restored->Load(store);
        FAIL() << "Load should throw";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos) << e.what();
    }
}

TEST_F(CheckpointTest, AgentLoadWithoutCheckpointReturnsFalse) {
    auto agent = MakeAgent(1);
    CheckpointStore store(dir);
    EXPECT_FALSE(agent->Load(store));
    EXPECT_EQ(agent->EnvSteps(), 0);
}
