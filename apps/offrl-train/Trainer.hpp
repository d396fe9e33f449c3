#pragma once
#include <memory>
#include <string>
#include "offrl/agent.hpp"
#include "offrl/checkpoint.hpp"
#include "offrl/metrics_logger.hpp"
#include "offrl/properties.hpp"
#include "offrl/rl.hpp"

// エピソードループ（学習・定期評価・チェックポイント）
class Trainer {
public:
    struct Param {
        std::string env = "cartpole";       // "cartpole" / "pendulum"
        int64_t max_steps = 100000;         // 総環境ステップ
        int max_episode_steps = 200;
        int eval_interval = 10;             // エピソード数
        int eval_episodes = 1;
        int64_t checkpoint_interval = 10000;
        std::string checkpoint_dir = "checkpoints";
        bool resume = false;

        Param() = default;
        Param(const offrl::Properties* props, const std::string& preset);
    };

    Trainer(const Param& param, offrl::rl::Environment& env, offrl::rl::OffPolicyAgent& agent,
        offrl::MetricsLogger* logger);

    void Run();
    float Evaluate();

private:
    Param param_;
    offrl::rl::Environment& env_;
    offrl::rl::OffPolicyAgent& agent_;
    offrl::MetricsLogger* logger_;
    offrl::CheckpointStore store_;
};
