#include "learners.hpp"
#include "offrl/ops.hpp"

namespace offrl::rl {

    namespace {
        NoiseOptions TargetNoiseOptions(const LearnerSpaces& spaces, const LearnerParam& param) {
            NoiseOptions o;
            o.dim = spaces.action.n;
            o.sigma = param.target_noise_std;
            o.n_step_annealing = 0;
            o.seed = static_cast<uint64_t>(param.seed) + 1;
            return o;
        }
    } // namespace

    Td3Learner::Td3Learner(const LearnerSpaces& spaces, const LearnerParam& param)
        : device_(spaces.device),
        param_(param),
        low_(spaces.action.low),
        high_(spaces.action.high),
        target_noise_(TargetNoiseOptions(spaces, param))
    {
        const auto hidden = ParseHiddenDims(param_.hidden);
        const int64_t action_dim = spaces.action.n;

        pi_ = DeterministicActor(spaces.state_dim, action_dim, hidden, low_, high_);
        target_pi_ = DeterministicActor(spaces.state_dim, action_dim, hidden, low_, high_);
        qvs_ = DoubleCritic(spaces.state_dim, action_dim, hidden);
        target_qvs_ = DoubleCritic(spaces.state_dim, action_dim, hidden);
        pi_->to(device_);
        target_pi_->to(device_);
        qvs_->to(device_);
        target_qvs_->to(device_);

        pi_optimizer_ = std::make_unique<torch::optim::Adam>(pi_->parameters(),
            torch::optim::AdamOptions(param_.actor_learning_rate));
        qvs_optimizer_ = std::make_unique<torch::optim::Adam>(qvs_->parameters(),
            torch::optim::AdamOptions(param_.learning_rate));
    }

    torch::Tensor Td3Learner::SelectAction(const torch::Tensor& state, bool) {
        torch::NoGradGuard no_grad;
        return pi_->forward(detail::AsBatch(state, device_)).squeeze(0).to(torch::kCPU);
    }

    torch::Tensor Td3Learner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        // ターゲット方策平滑化：クリップしたノイズを加えて行動範囲に収める
        const float limit = param_.target_noise_limit;
        auto noise = target_noise_.SampleBatch(batch.Size()).clamp(-limit, limit).to(device_);
        auto next_action = (target_pi_->forward(batch.next_state) + noise).clamp(low_, high_);

        auto [q1, q2] = target_qvs_->forward(batch.next_state, next_action);
        auto next_value = torch::min(q1, q2);
        return ops::TdTarget(batch.reward, batch.mask, next_value, discount);
    }

    std::vector<LossTerm> Td3Learner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        auto [q1, q2] = qvs_->forward(batch.state, batch.action);
        auto loss = ops::MseLoss(q1, target) + ops::MseLoss(q2, target);
        return { LossTerm{ "qv_loss", loss, qvs_optimizer_.get(), qvs_->parameters(), param_.critic_grad_norm } };
    }

    std::vector<LossTerm> Td3Learner::ActorLosses(const Batch& batch) {
        auto loss = -qvs_->q1->forward(batch.state, pi_->forward(batch.state)).mean();
        return { LossTerm{ "pi_loss", loss, pi_optimizer_.get(), pi_->parameters(), param_.actor_grad_norm } };
    }

    std::vector<TargetPair> Td3Learner::TargetPairs() {
        return { { "pi", pi_.ptr(), target_pi_.ptr() }, { "qvs", qvs_.ptr(), target_qvs_.ptr() } };
    }

    std::vector<NamedNetwork> Td3Learner::Networks() {
        return {
            { "pi", pi_.ptr() }, { "target_pi", target_pi_.ptr() },
            { "qvs", qvs_.ptr() }, { "target_qvs", target_qvs_.ptr() },
        };
    }

} // namespace offrl::rl
