#include "offrl/rollout.hpp"
#include <stdexcept>
#include <string>

namespace offrl::rl {

    RolloutAccumulator::RolloutAccumulator(int64_t length, float discount)
        : length_(length), discount_(discount)
    {
        if (length_ < 1)
            throw std::invalid_argument("RolloutAccumulator: length must be >= 1, got " + std::to_string(length_));
        if (!(discount_ >= 0.0f && discount_ <= 1.0f))
            throw std::invalid_argument("RolloutAccumulator: discount must be in [0, 1], got " + std::to_string(discount_));
    }

    void RolloutAccumulator::Push(const torch::Tensor& state, const torch::Tensor& action, float reward) {
        if (Ready()) window_.pop_front();
        window_.push_back({ state.detach().clone(), action.detach().clone(), reward });
    }

    std::optional<Transition> RolloutAccumulator::GetTransition(const torch::Tensor& next_state, bool done) const {
        if (!Ready()) return std::nullopt;
        const auto& oldest = window_.front();
        return Transition{ oldest.state, oldest.action, CumulativeReward(), next_state.detach().clone(),
            done ? 0.0f : 1.0f };
    }

    float RolloutAccumulator::CumulativeReward() const {
        float cum_reward = 0.0f;
        float scale = 1.0f;
        for (const auto& e : window_) {
            cum_reward += scale * e.reward;
            scale *= discount_;
        }
        return cum_reward;
    }

} // namespace offrl::rl
