#pragma once
#include <torch/torch.h>
#include <deque>
#include <optional>
#include "offrl/rl.hpp"

namespace offrl::rl {

    /**
     * @brief n-step リターン用のスライディングウィンドウ。
     *
     * 直近 n 個の (state, action, reward) を保持し、満杯になると
     * 最古の state/action と Σ γ^t r_t を持つ遷移を返す（実時間より n ステップ遅れ）。
     * エピソード境界では必ず Reset() すること（報酬がエピソードを跨がないように）。
     */
    class RolloutAccumulator {
    public:
        RolloutAccumulator(int64_t length, float discount);

        void Push(const torch::Tensor& state, const torch::Tensor& action, float reward);

        // Ready() でなければ std::nullopt。mask = 1 - done
        std::optional<Transition> GetTransition(const torch::Tensor& next_state, bool done) const;

        void Reset() { window_.clear(); }

        bool Ready() const { return static_cast<int64_t>(window_.size()) == length_; }
        int64_t Length() const { return length_; }
        int64_t Size() const { return static_cast<int64_t>(window_.size()); }
        float Discount() const { return discount_; }

        // 現在のウィンドウ内容に対する Σ_{t} γ^t r_t
        float CumulativeReward() const;

    private:
        struct Entry {
            torch::Tensor state;
            torch::Tensor action;
            float reward;
        };

        int64_t length_;
        float discount_;
        std::deque<Entry> window_;
    };

} // namespace offrl::rl
