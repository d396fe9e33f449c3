#include "learners.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include "offrl/ops.hpp"

namespace offrl::rl {

    SacLearner::SacLearner(const LearnerSpaces& spaces, const LearnerParam& param)
        : device_(spaces.device),
        param_(param),
        target_entropy_(-static_cast<float>(spaces.action.n)),
        alpha_(param.alpha)
    {
        if (!(param_.alpha > 0.0f))
            throw std::invalid_argument("SacLearner: alpha must be positive, got " + std::to_string(param_.alpha));

        const auto hidden = ParseHiddenDims(param_.hidden);
        const int64_t action_dim = spaces.action.n;

        pi_ = GaussianActor(spaces.state_dim, action_dim, hidden, spaces.action.low, spaces.action.high);
        qvs_ = DoubleCritic(spaces.state_dim, action_dim, hidden);
        target_qvs_ = DoubleCritic(spaces.state_dim, action_dim, hidden);
        pi_->to(device_);
        qvs_->to(device_);
        target_qvs_->to(device_);

        pi_optimizer_ = std::make_unique<torch::optim::Adam>(pi_->parameters(),
            torch::optim::AdamOptions(param_.actor_learning_rate));
        q1_optimizer_ = std::make_unique<torch::optim::Adam>(qvs_->Q1Parameters(),
            torch::optim::AdamOptions(param_.learning_rate));
        q2_optimizer_ = std::make_unique<torch::optim::Adam>(qvs_->Q2Parameters(),
            torch::optim::AdamOptions(param_.learning_rate));

        log_alpha_ = torch::full({ 1 }, std::log(alpha_), torch::TensorOptions().dtype(torch::kFloat).device(device_))
            .set_requires_grad(param_.alpha_tuning);
        if (param_.alpha_tuning) {
            alpha_optimizer_ = std::make_unique<torch::optim::Adam>(std::vector<torch::Tensor>{ log_alpha_ },
                torch::optim::AdamOptions(param_.alpha_learning_rate));
        }
    }

    torch::Tensor SacLearner::SelectAction(const torch::Tensor& state, bool explore) {
        torch::NoGradGuard no_grad;
        auto [action, log_prob, mean_action] = pi_->Sample(detail::AsBatch(state, device_), !explore);
        return (explore ? action : mean_action).squeeze(0).to(torch::kCPU);
    }

    torch::Tensor SacLearner::ComputeTarget(const Batch& batch, float discount) {
        torch::NoGradGuard no_grad;
        auto [next_action, next_log_prob, unused] = pi_->Sample(batch.next_state);
        auto [q1, q2] = target_qvs_->forward(batch.next_state, next_action);
        auto next_value = torch::min(q1, q2) - alpha_ * next_log_prob;
        return ops::TdTarget(batch.reward, batch.mask, next_value, discount);
    }

    std::vector<LossTerm> SacLearner::CriticLosses(const Batch& batch, const torch::Tensor& target) {
        auto [q1, q2] = qvs_->forward(batch.state, batch.action);
        return {
            LossTerm{ "q1_loss", ops::MseLoss(q1, target), q1_optimizer_.get(), qvs_->Q1Parameters(), param_.critic_grad_norm },
            LossTerm{ "q2_loss", ops::MseLoss(q2, target), q2_optimizer_.get(), qvs_->Q2Parameters(), param_.critic_grad_norm },
        };
    }

    std::vector<LossTerm> SacLearner::ActorLosses(const Batch& batch) {
        auto [action, log_prob, unused] = pi_->Sample(batch.state);
        auto [q1, q2] = qvs_->forward(batch.state, action);
        auto policy_loss = (alpha_ * log_prob - torch::min(q1, q2)).mean();

        std::vector<LossTerm> terms;
        terms.push_back({ "pi_loss", policy_loss, pi_optimizer_.get(), pi_->parameters(), param_.actor_grad_norm });
        if (param_.alpha_tuning) {
            auto alpha_loss = -(log_alpha_ * (log_prob + target_entropy_).detach()).mean();
            terms.push_back({ "alpha_loss", alpha_loss, alpha_optimizer_.get(), { log_alpha_ }, 0.0f });
        }
        return terms;
    }

    void SacLearner::OnActorStepped() {
        if (param_.alpha_tuning)
            alpha_ = log_alpha_.detach().exp().item<float>();
    }

    std::vector<TargetPair> SacLearner::TargetPairs() {
        return { { "qvs", qvs_.ptr(), target_qvs_.ptr() } };
    }

    std::vector<NamedNetwork> SacLearner::Networks() {
        return { { "pi", pi_.ptr() }, { "qvs", qvs_.ptr() }, { "target_qvs", target_qvs_.ptr() } };
    }

    void SacLearner::Save(torch::serialize::OutputArchive& archive) {
        Learner::Save(archive);
        archive.write("log_alpha", log_alpha_.detach(), /*is_buffer=*/true);
    }

    void SacLearner::Load(torch::serialize::InputArchive& archive) {
        Learner::Load(archive);
        torch::Tensor log_alpha;
        archive.read("log_alpha", log_alpha, /*is_buffer=*/true);
        {
            torch::NoGradGuard no_grad;
            log_alpha_.copy_(log_alpha.to(device_));
        }
        alpha_ = log_alpha_.detach().exp().item<float>();
    }

} // namespace offrl::rl
