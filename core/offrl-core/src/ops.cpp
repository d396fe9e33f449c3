#include "offrl/ops.hpp"

namespace offrl::rl::ops {

    torch::Tensor TdTarget(const torch::Tensor& reward, const torch::Tensor& mask,
        const torch::Tensor& next_value, float discount)
    {
        return reward + mask * discount * next_value;
    }

    torch::Tensor MseLoss(const torch::Tensor& prediction, const torch::Tensor& target) {
        TORCH_CHECK(prediction.sizes() == target.sizes(),
            "MseLoss: shape mismatch ", prediction.sizes(), " vs ", target.sizes());
        return (prediction - target).pow(2).mean();
    }

    torch::Tensor Huber(const torch::Tensor& x, float kappa) {
        auto abs_x = x.abs();
        return torch::where(abs_x <= kappa, 0.5f * x.pow(2), kappa * (abs_x - 0.5f * kappa));
    }

    torch::Tensor CumulativeDensity(int64_t quantiles, torch::Device device) {
        TORCH_CHECK(quantiles >= 1, "CumulativeDensity: quantiles must be >= 1, got ", quantiles);
        auto opt = torch::TensorOptions().dtype(torch::kFloat).device(device);
        return ((torch::arange(quantiles, opt) + 0.5f) / static_cast<float>(quantiles)).unsqueeze(0);
    }

    torch::Tensor QuantileHuberLoss(const torch::Tensor& prediction, const torch::Tensor& target,
        const torch::Tensor& tau, float kappa)
    {
        TORCH_CHECK(prediction.dim() == 2 && target.dim() == 2 && prediction.size(0) == target.size(0),
            "QuantileHuberLoss: expected (B, N) and (B, N'), got ", prediction.sizes(), " and ", target.sizes());
        TORCH_CHECK(tau.numel() == prediction.size(1),
            "QuantileHuberLoss: tau has ", tau.numel(), " elements, prediction has ", prediction.size(1), " quantiles");

        auto diff = target.unsqueeze(1) - prediction.unsqueeze(2);          // (B, N, N')
        auto weight = (tau.reshape({ 1, -1, 1 }) - (diff.detach() < 0).to(torch::kFloat)).abs();
        auto loss = weight * Huber(diff, kappa);
        return loss.mean(2).sum(1).mean();
    }

    torch::Tensor L2Loss(const torch::nn::Module& module) {
        torch::Tensor total;
        for (const auto& p : module.parameters()) {
            auto term = p.pow(2).sum();
            total = total.defined() ? total + term : term;
        }
        if (!total.defined())
            return torch::zeros({});
        return total;
    }

} // namespace offrl::rl::ops
