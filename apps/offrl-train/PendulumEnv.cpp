#include "PendulumEnv.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// 定数
const float max_speed = 8.0f;
const float max_torque = 2.0f;
const float dt = 0.05f;
const float g = 10.0f;
const float m = 1.0f;
const float l = 1.0f;
const float pi = 3.14159265f;

namespace {
    // [-π, π) へ
    float AngleNormalize(float x) {
        return std::fmod(std::fmod(x + pi, 2.0f * pi) + 2.0f * pi, 2.0f * pi) - pi;
    }
}

PendulumEnv::PendulumEnv(uint64_t seed, int max_steps)
    : max_steps_(max_steps), gen_(static_cast<std::mt19937::result_type>(seed))
{
    if (max_steps_ < 1)
        throw std::invalid_argument("PendulumEnv: max_steps must be >= 1, got " + std::to_string(max_steps_));
    Reset();
}

offrl::rl::StateSpaceInfo PendulumEnv::GetStateSpaceInfo() const {
    return {
        torch::tensor({ 3 }, torch::kLong),
        torch::tensor({ -1.0f, -1.0f, -max_speed }),
        torch::tensor({ 1.0f, 1.0f, max_speed }),
    };
}

offrl::rl::ActionSpaceInfo PendulumEnv::GetActionSpaceInfo() const {
    offrl::rl::ActionSpaceInfo info;
    info.discrete = false;
    info.n = 1;
    info.low = -max_torque;
    info.high = max_torque;
    return info;
}

torch::Tensor PendulumEnv::Reset(offrl::rl::RunMode mode) {
    if (offrl::rl::IsTrain(mode)) {
        std::uniform_real_distribution<float> angle(-pi, pi);
        std::uniform_real_distribution<float> speed(-1.0f, 1.0f);
        theta = angle(gen_);
        theta_dot = speed(gen_);
    } else {
        // 評価モードでは真下から
        theta = pi;
        theta_dot = 0.0f;
    }
    step_count = 0;
    return GetState();
}

torch::Tensor PendulumEnv::GetState() const {
    return torch::tensor({ std::cos(theta), std::sin(theta), theta_dot });
}

offrl::rl::EnvResponse PendulumEnv::DoStep(const torch::Tensor& action_tensor, offrl::rl::RunMode) {
    const float u = std::clamp(action_tensor.to(torch::kFloat).reshape({ -1 })[0].item<float>(), -max_torque, max_torque);

    const float th = AngleNormalize(theta);
    const float cost = th * th + 0.1f * theta_dot * theta_dot + 0.001f * u * u;

    theta_dot = std::clamp(theta_dot + (3.0f * g / (2.0f * l) * std::sin(theta) + 3.0f / (m * l * l) * u) * dt,
        -max_speed, max_speed);
    theta += theta_dot * dt;

    step_count++;
    const bool truncated = step_count >= max_steps_;
    return { GetState(), -cost, truncated, truncated };
}
