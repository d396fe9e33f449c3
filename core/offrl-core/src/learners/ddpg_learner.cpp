#include "learners.hpp"
#include <stdexcept>
#include <string>
#include "offrl/ops.hpp"

namespace offrl::rl {

    DdpgLearner::DdpgLearner(const LearnerSpaces& spaces, const LearnerParam& param, bool quantile)
        : device_(spaces.device), quantile_(quantile), param_(param)
    {
        if (quantile_ && param_.support_dim < 1)
            throw std::invalid_argument("DdpgLearner: support_dim must be >= 1, got " + std::to_string(param_.support_dim));

        const auto hidden = ParseHiddenDims(param_.hidden);
        const int64_t action_dim = spaces.action.n;
        const int64_t output_dim = quantile_ ? param_.support_dim : 1;
        const float low = spaces.action.low;
        const float high = spaces.action.high;

        pi_ = DeterministicActor(spaces.state_dim, action_dim, hidden, low, high);
        target_pi_ = DeterministicActor(spaces.state_dim, action_dim, hidden, low, high);
        qv_ = Critic(spaces.state_dim, action_dim, hidden, output_dim);
        target_qv_ = Critic(spaces.state_dim, action_dim, hidden, output_dim);
        pi_->to(device_);
        target_pi_->to(device_);
        qv_->to(device_);
        target_qv_->to(device_);

        if (quantile_)
            tau_ = ops::CumulativeDensity(param_.support_dim, device_);

        pi_optimizer_ = std::make_unique<torch::optim::Adam>(pi_->parameters(),
            torch::optim::AdamOptions(param_.actor_learning_rate));
        qv_optimizer_ = std::make_unique<torch::optim::Adam>(qv_->parameters(),
            torch::optim::AdamOptions(param_.learning_rate));
    }

    torch::Tensor DdpgLearner::SelectAction(const torch::Tensor& state, bool) {
        torch::NoGradGuard no_grad;
        return pi_->forward(detail::AsBatch(state, device_)).squeeze(0).to(torch::kCPU);
    }

    torch::Tensor DdpgLearner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        auto next_action = target_pi_->forward(batch.next_state);
        auto next_value = target_qv_->forward(batch.next_state, next_action);     // (B, 1) or (B, N)
        return ops::TdTarget(batch.reward, batch.mask, next_value, discount);
    }

    std::vector<LossTerm> DdpgLearner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        auto expected = qv_->forward(batch.state, batch.action);
        torch::Tensor loss = quantile_
            ? ops::QuantileHuberLoss(expected, target, tau_, param_.quantile_kappa)
            : ops::MseLoss(expected, target);
        if (param_.critic_l2_reg > 0.0f)
            loss = loss + param_.critic_l2_reg * ops::L2Loss(*qv_);
        return { LossTerm{ "qv_loss", loss, qv_optimizer_.get(), qv_->parameters(), param_.critic_grad_norm } };
    }

    std::vector<LossTerm> DdpgLearner::ActorLosses(const Batch& batch) {
        auto q = qv_->forward(batch.state, pi_->forward(batch.state));
        if (quantile_) q = q.mean(-1, /*keepdim=*/true);
        auto loss = -q.mean();
        return { LossTerm{ "pi_loss", loss, pi_optimizer_.get(), pi_->parameters(), param_.actor_grad_norm } };
    }

    std::vector<TargetPair> DdpgLearner::TargetPairs() {
        return { { "pi", pi_.ptr(), target_pi_.ptr() }, { "qv", qv_.ptr(), target_qv_.ptr() } };
    }

    std::vector<NamedNetwork> DdpgLearner::Networks() {
        return {
            { "pi", pi_.ptr() }, { "target_pi", target_pi_.ptr() },
            { "qv", qv_.ptr() }, { "target_qv", target_qv_.ptr() },
        };
    }

} // namespace offrl::rl
