#pragma once
#include <torch/torch.h>
#include <cstdint>

namespace offrl::rl::ops {

    // r + mask * discount * next（B, ...）
    torch::Tensor TdTarget(const torch::Tensor& reward, const torch::Tensor& mask,
        const torch::Tensor& next_value, float discount);

    torch::Tensor MseLoss(const torch::Tensor& prediction, const torch::Tensor& target);

    // 要素ごとの Huber（|x| <= kappa で二乗、それ以外は線形）
    torch::Tensor Huber(const torch::Tensor& x, float kappa = 1.0f);

    // 分位点の中点 τ_i = (i + 0.5) / N を (1, N) で返す
    torch::Tensor CumulativeDensity(int64_t quantiles, torch::Device device = torch::kCPU);

    /**
     * @brief 分位点回帰 Huber 損失（QR-DQN）。
     * prediction (B, N), target (B, N'), tau (1, N)。
     * ρ_τ(u) = |τ - 1{u<0}| · Huber(u), u = target_j - prediction_i。
     * target 側で平均、分位点側で和、バッチで平均。
     */
    torch::Tensor QuantileHuberLoss(const torch::Tensor& prediction, const torch::Tensor& target,
        const torch::Tensor& tau, float kappa = 1.0f);

    // Σ ||θ||² （バイアス含む全パラメータ）
    torch::Tensor L2Loss(const torch::nn::Module& module);

} // namespace offrl::rl::ops
