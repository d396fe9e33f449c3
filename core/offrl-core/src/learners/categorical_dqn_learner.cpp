#include "learners.hpp"
#include "offrl/ops.hpp"

namespace offrl::rl {

    CategoricalDqnLearner::CategoricalDqnLearner(const LearnerSpaces& spaces, const LearnerParam& param)
        : device_(spaces.device),
        double_q_(param.use_double_q),
        grad_clip_(param.critic_grad_norm),
        projector_(param.support_dim, param.v_min, param.v_max, spaces.device)
    {
        const auto hidden = ParseHiddenDims(param.hidden);
        qv_ = CategoricalQNet(spaces.state_dim, spaces.action.n, param.support_dim, hidden, param.use_dueling);
        target_qv_ = CategoricalQNet(spaces.state_dim, spaces.action.n, param.support_dim, hidden, param.use_dueling);
        qv_->to(device_);
        target_qv_->to(device_);
        optimizer_ = std::make_unique<torch::optim::Adam>(qv_->parameters(), torch::optim::AdamOptions(param.learning_rate));
    }

    torch::Tensor CategoricalDqnLearner::ExpectedQ(const torch::Tensor& probs) const {
        return (probs * projector_.Support().view({ 1, 1, -1 })).sum(-1);
    }

    torch::Tensor CategoricalDqnLearner::SelectAction(const torch::Tensor& state, bool) {
        torch::NoGradGuard no_grad;
        auto probs = qv_->Probabilities(detail::AsBatch(state, device_));   // (1, A, atoms)
        return ExpectedQ(probs).argmax(1).to(torch::kCPU, torch::kLong);
    }

    torch::Tensor CategoricalDqnLearner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        const int64_t B = batch.Size();
        const int64_t atoms = projector_.Atoms();

        auto next_probs_all = target_qv_->Probabilities(batch.next_state);         // (B, A, atoms)
        auto selector = double_q_ ? qv_->Probabilities(batch.next_state) : next_probs_all;
        auto next_action = ExpectedQ(selector).argmax(1);                           // (B,)
        auto idx = next_action.view({ B, 1, 1 }).expand({ B, 1, atoms });
        auto next_probs = next_probs_all.gather(1, idx).squeeze(1);                 // (B, atoms)

        return projector_.Project(next_probs, batch.reward, batch.mask, discount);
    }

    std::vector<LossTerm> CategoricalDqnLearner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        const int64_t B = batch.Size();
        const int64_t atoms = projector_.Atoms();
        auto logits = qv_->forward(batch.state);                                    // (B, A, atoms)
        auto idx = detail::ActionIndex(batch.action).view({ B, 1, 1 }).expand({ B, 1, atoms });
        auto log_probs = torch::log_softmax(logits.gather(1, idx).squeeze(1), -1);  // (B, atoms)
        // 交差エントロピー
        auto loss = -(target * log_probs).sum(-1).mean();
        return { LossTerm{ "qv_loss", loss, optimizer_.get(), qv_->parameters(), grad_clip_ } };
    }

    std::vector<TargetPair> CategoricalDqnLearner::TargetPairs() {
        return { { "qv", qv_.ptr(), target_qv_.ptr() } };
    }

    std::vector<NamedNetwork> CategoricalDqnLearner::Networks() {
        return { { "qv", qv_.ptr() }, { "target_qv", target_qv_.ptr() } };
    }

} // namespace offrl::rl
