#include "learners.hpp"
#include "offrl/ops.hpp"

namespace offrl::rl {

    DqnLearner::DqnLearner(const LearnerSpaces& spaces, const LearnerParam& param, bool double_q)
        : device_(spaces.device), double_q_(double_q), grad_clip_(param.critic_grad_norm)
    {
        const auto hidden = ParseHiddenDims(param.hidden);
        qv_ = QNet(spaces.state_dim, spaces.action.n, hidden, param.use_dueling);
        target_qv_ = QNet(spaces.state_dim, spaces.action.n, hidden, param.use_dueling);
        qv_->to(device_);
        target_qv_->to(device_);
        optimizer_ = std::make_unique<torch::optim::Adam>(qv_->parameters(), torch::optim::AdamOptions(param.learning_rate));
    }

    torch::Tensor DqnLearner::SelectAction(const torch::Tensor& state, bool) {
        torch::NoGradGuard no_grad;
        auto q_values = qv_->forward(detail::AsBatch(state, device_));     // (1, A)
        return q_values.argmax(1).to(torch::kCPU, torch::kLong);           // (1,)
    }

    torch::Tensor DqnLearner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        auto next_q = target_qv_->forward(batch.next_state);               // (B, A)
        torch::Tensor next_value;
        if (double_q_) {
            // 行動選択は live、評価は target
            auto next_action = qv_->forward(batch.next_state).argmax(1, /*keepdim=*/true);
            next_value = next_q.gather(1, next_action);
        } else {
            next_value = std::get<0>(next_q.max(1, /*keepdim=*/true));
        }
        return ops::TdTarget(batch.reward, batch.mask, next_value, discount);   // (B, 1)
    }

    std::vector<LossTerm> DqnLearner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        auto q_sa = qv_->forward(batch.state).gather(1, detail::ActionIndex(batch.action));   // (B, 1)
        return { LossTerm{ "qv_loss", ops::MseLoss(q_sa, target), optimizer_.get(), qv_->parameters(), grad_clip_ } };
    }

    std::vector<TargetPair> DqnLearner::TargetPairs() {
        return { { "qv", qv_.ptr(), target_qv_.ptr() } };
    }

    std::vector<NamedNetwork> DqnLearner::Networks() {
        return { { "qv", qv_.ptr() }, { "target_qv", target_qv_.ptr() } };
    }

} // namespace offrl::rl
