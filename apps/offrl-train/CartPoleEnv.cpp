#include "CartPoleEnv.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

// 定数
const float x_limit = 2.4f;
const float theta_limit = 12.0f * 2.0f * 3.14159265f / 360.0f;
const float gravity = 9.8f;
const float masscart = 1.0f;
const float mass_pole = 0.10f;
const float total_mass = masscart + mass_pole;
const float length = 0.5f;
const float polemass_length = mass_pole * length;
const float force_mag = 10.0f;
const float tau = 0.02f;

CartPoleEnv::CartPoleEnv(uint64_t seed, int max_steps)
    : max_steps_(max_steps), gen_(static_cast<std::mt19937::result_type>(seed))
{
    if (max_steps_ < 1)
        throw std::invalid_argument("CartPoleEnv: max_steps must be >= 1, got " + std::to_string(max_steps_));
    Reset();
}

offrl::rl::StateSpaceInfo CartPoleEnv::GetStateSpaceInfo() const {
    const float inf = 3.4e38f;
    return {
        torch::tensor({ 4 }, torch::kLong),
        torch::tensor({ -x_limit * 2.0f, -inf, -theta_limit * 2.0f, -inf }),
        torch::tensor({ x_limit * 2.0f, inf, theta_limit * 2.0f, inf }),
    };
}

offrl::rl::ActionSpaceInfo CartPoleEnv::GetActionSpaceInfo() const {
    offrl::rl::ActionSpaceInfo info;
    info.discrete = true;
    info.n = 2;
    return info;
}

torch::Tensor CartPoleEnv::Reset(offrl::rl::RunMode mode) {
    if (offrl::rl::IsTrain(mode)) {
        std::uniform_real_distribution<float> dist(-0.05f, 0.05f);
        x = dist(gen_);
        x_dot = dist(gen_);
        theta = dist(gen_);
        theta_dot = dist(gen_);
    } else {
        // 評価モードでは初期状態固定
        x = 0;
        x_dot = 0;
        theta = 0;
        theta_dot = 0;
    }
    step_count = 0;
    return GetState();
}

torch::Tensor CartPoleEnv::GetState() const {
    return torch::tensor({ x, x_dot, theta, theta_dot });
}

offrl::rl::EnvResponse CartPoleEnv::DoStep(const torch::Tensor& action_tensor, offrl::rl::RunMode) {
    const int action = action_tensor.to(torch::kLong).item<int>();
    if (action != 0 && action != 1)
        throw std::out_of_range("CartPoleEnv: action must be 0 or 1, got " + std::to_string(action));

    // 力の符号（右:+、左-）
    const float force = (action == 1) ? force_mag : -force_mag;

    // 運動方程式
    const float costheta = std::cos(theta);
    const float sintheta = std::sin(theta);
    const float temp = (force + polemass_length * theta_dot * theta_dot * sintheta) / total_mass;
    const float thetaacc = (gravity * sintheta - costheta * temp) /
        (length * (4.0f / 3.0f - mass_pole * costheta * costheta / total_mass));
    const float xacc = temp - polemass_length * thetaacc * costheta / total_mass;

    // 更新
    x += tau * x_dot;
    x_dot += tau * xacc;
    theta += tau * theta_dot;
    theta_dot += tau * thetaacc;

    step_count++;

    // 倒れた or 枠外で終端、max_steps 到達は打ち切り
    const bool failed = (x < -x_limit || x > x_limit || theta < -theta_limit || theta > theta_limit);
    const bool truncated = !failed && step_count >= max_steps_;

    return { GetState(), 1.0f, failed || truncated, truncated };
}
