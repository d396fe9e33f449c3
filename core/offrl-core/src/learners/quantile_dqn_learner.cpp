#include "learners.hpp"
#include <stdexcept>
#include <string>
#include "offrl/ops.hpp"

namespace offrl::rl {

    QuantileDqnLearner::QuantileDqnLearner(const LearnerSpaces& spaces, const LearnerParam& param)
        : device_(spaces.device),
        double_q_(param.use_double_q),
        grad_clip_(param.critic_grad_norm),
        kappa_(param.quantile_kappa)
    {
        if (param.support_dim < 1)
            throw std::invalid_argument("QuantileDqnLearner: support_dim must be >= 1, got " + std::to_string(param.support_dim));
        const auto hidden = ParseHiddenDims(param.hidden);
        qv_ = QuantileQNet(spaces.state_dim, spaces.action.n, param.support_dim, hidden);
        target_qv_ = QuantileQNet(spaces.state_dim, spaces.action.n, param.support_dim, hidden);
        qv_->to(device_);
        target_qv_->to(device_);
        tau_ = ops::CumulativeDensity(param.support_dim, device_);
        optimizer_ = std::make_unique<torch::optim::Adam>(qv_->parameters(), torch::optim::AdamOptions(param.learning_rate));
    }

    torch::Tensor QuantileDqnLearner::SelectAction(const torch::Tensor& state, bool) {
        torch::NoGradGuard no_grad;
        auto quantiles = qv_->forward(detail::AsBatch(state, device_));    // (1, A, N)
        return quantiles.mean(-1).argmax(1).to(torch::kCPU, torch::kLong);
    }

    torch::Tensor QuantileDqnLearner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        const int64_t B = batch.Size();
        const int64_t N = tau_.size(1);

        auto next_quantiles_all = target_qv_->forward(batch.next_state);           // (B, A, N)
        auto selector = double_q_ ? qv_->forward(batch.next_state) : next_quantiles_all;
        auto next_action = selector.mean(-1).argmax(1);
        auto idx = next_action.view({ B, 1, 1 }).expand({ B, 1, N });
        auto next_quantiles = next_quantiles_all.gather(1, idx).squeeze(1);         // (B, N)

        return ops::TdTarget(batch.reward, batch.mask, next_quantiles, discount);   // (B, N)
    }

    std::vector<LossTerm> QuantileDqnLearner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        const int64_t B = batch.Size();
        const int64_t N = tau_.size(1);
        auto idx = detail::ActionIndex(batch.action).view({ B, 1, 1 }).expand({ B, 1, N });
        auto quantiles = qv_->forward(batch.state).gather(1, idx).squeeze(1);       // (B, N)
        auto loss = ops::QuantileHuberLoss(quantiles, target, tau_, kappa_);
        return { LossTerm{ "qv_loss", loss, optimizer_.get(), qv_->parameters(), grad_clip_ } };
    }

    std::vector<TargetPair> QuantileDqnLearner::TargetPairs() {
        return { { "qv", qv_.ptr(), target_qv_.ptr() } };
    }

    std::vector<NamedNetwork> QuantileDqnLearner::Networks() {
        return { { "qv", qv_.ptr() }, { "target_qv", target_qv_.ptr() } };
    }

} // namespace offrl::rl
