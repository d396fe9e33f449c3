#pragma once
#include <random>
#include "offrl/rl.hpp"

// 連続1次元トルクの振り上げ振子。終端なし、max_steps で打ち切り
class PendulumEnv : public offrl::rl::Environment {
public:
    explicit PendulumEnv(uint64_t seed = 1337, int max_steps = 200);

    offrl::rl::StateSpaceInfo GetStateSpaceInfo() const override;
    offrl::rl::ActionSpaceInfo GetActionSpaceInfo() const override;

    torch::Tensor Reset(offrl::rl::RunMode mode = offrl::rl::RunMode::Train) override;
    offrl::rl::EnvResponse DoStep(const torch::Tensor& action, offrl::rl::RunMode mode = offrl::rl::RunMode::Train) override;
    torch::Tensor GetState() const override;

private:
    float theta = 0.0f;
    float theta_dot = 0.0f;
    int step_count = 0;
    int max_steps_;
    std::mt19937 gen_;
};
