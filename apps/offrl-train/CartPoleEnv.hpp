#pragma once
#include <random>
#include "offrl/rl.hpp"

// 離散2行動の倒立振子（左右に一定の力を加える）
class CartPoleEnv : public offrl::rl::Environment {
public:
    explicit CartPoleEnv(uint64_t seed = 1337, int max_steps = 200);

    offrl::rl::StateSpaceInfo GetStateSpaceInfo() const override;
    offrl::rl::ActionSpaceInfo GetActionSpaceInfo() const override;

    torch::Tensor Reset(offrl::rl::RunMode mode = offrl::rl::RunMode::Train) override;
    offrl::rl::EnvResponse DoStep(const torch::Tensor& action, offrl::rl::RunMode mode = offrl::rl::RunMode::Train) override;
    torch::Tensor GetState() const override;

private:
    float x = 0.0f;
    float x_dot = 0.0f;
    float theta = 0.0f;
    float theta_dot = 0.0f;
    int step_count = 0;
    int max_steps_;
    std::mt19937 gen_;
};
