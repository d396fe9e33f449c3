#pragma once
#include <torch/torch.h>
#include <memory>
#include <vector>
#include "offrl/distributional.hpp"
#include "offrl/exploration.hpp"
#include "offrl/learner.hpp"
#include "offrl/networks.hpp"

namespace offrl::rl {

    // ======================================================
    // DQN / Double DQN（dueling は QNet 側）
    // ======================================================
    class DqnLearner : public Learner {
    public:
        DqnLearner(const LearnerSpaces& spaces, const LearnerParam& param, bool double_q);

        AgentType Type() const override { return double_q_ ? AgentType::DoubleDQN : AgentType::DQN; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

    private:
        torch::Device device_;
        bool double_q_;
        float grad_clip_;
        QNet qv_{ nullptr };
        QNet target_qv_{ nullptr };
        std::unique_ptr<torch::optim::Adam> optimizer_;
    };

    // ======================================================
    // Categorical DQN（C51）
    // ======================================================
    class CategoricalDqnLearner : public Learner {
    public:
        CategoricalDqnLearner(const LearnerSpaces& spaces, const LearnerParam& param);

        AgentType Type() const override { return AgentType::CategoricalDQN; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

        const CategoricalProjector& Projector() const { return projector_; }

    private:
        // (B, A, atoms) の確率から期待値 (B, A)
        torch::Tensor ExpectedQ(const torch::Tensor& probs) const;

        torch::Device device_;
        bool double_q_;
        float grad_clip_;
        CategoricalProjector projector_;
        CategoricalQNet qv_{ nullptr };
        CategoricalQNet target_qv_{ nullptr };
        std::unique_ptr<torch::optim::Adam> optimizer_;
    };

    // ======================================================
    // Quantile Regression DQN
    // ======================================================
    class QuantileDqnLearner : public Learner {
    public:
        QuantileDqnLearner(const LearnerSpaces& spaces, const LearnerParam& param);

        AgentType Type() const override { return AgentType::QuantileDQN; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

    private:
        torch::Device device_;
        bool double_q_;
        float grad_clip_;
        float kappa_;
        torch::Tensor tau_;     // (1, N)
        QuantileQNet qv_{ nullptr };
        QuantileQNet target_qv_{ nullptr };
        std::unique_ptr<torch::optim::Adam> optimizer_;
    };

    // ======================================================
    // DDPG（quantile = true で QR-DDPG）
    // ======================================================
    class DdpgLearner : public Learner {
    public:
        DdpgLearner(const LearnerSpaces& spaces, const LearnerParam& param, bool quantile);

        AgentType Type() const override { return quantile_ ? AgentType::QuantileDDPG : AgentType::DDPG; }
        bool HasActor() const override { return true; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<LossTerm> ActorLosses(const Batch& batch) override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

    private:
        torch::Device device_;
        bool quantile_;
        LearnerParam param_;
        torch::Tensor tau_;     // QR のみ (1, N)
        DeterministicActor pi_{ nullptr };
        DeterministicActor target_pi_{ nullptr };
        Critic qv_{ nullptr };
        Critic target_qv_{ nullptr };
        std::unique_ptr<torch::optim::Adam> pi_optimizer_;
        std::unique_ptr<torch::optim::Adam> qv_optimizer_;
    };

    // ======================================================
    // TD3
    // ======================================================
    class Td3Learner : public Learner {
    public:
        Td3Learner(const LearnerSpaces& spaces, const LearnerParam& param);

        AgentType Type() const override { return AgentType::TD3; }
        bool HasActor() const override { return true; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<LossTerm> ActorLosses(const Batch& batch) override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

    private:
        torch::Device device_;
        LearnerParam param_;
        float low_;
        float high_;
        GaussianNoise target_noise_;
        DeterministicActor pi_{ nullptr };
        DeterministicActor target_pi_{ nullptr };
        DoubleCritic qvs_{ nullptr };
        DoubleCritic target_qvs_{ nullptr };
        std::unique_ptr<torch::optim::Adam> pi_optimizer_;
        std::unique_ptr<torch::optim::Adam> qvs_optimizer_;
    };

    // ======================================================
    // SAC
    // ======================================================
    class SacLearner : public Learner {
    public:
        SacLearner(const LearnerSpaces& spaces, const LearnerParam& param);

        AgentType Type() const override { return AgentType::SAC; }
        bool HasActor() const override { return true; }
        bool Stochastic() const override { return true; }
        torch::Tensor SelectAction(const torch::Tensor& state, bool explore) override;
        torch::Tensor ComputeTarget(const Batch& batch, float discount) override;
        std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) override;
        std::vector<LossTerm> ActorLosses(const Batch& batch) override;
        void OnActorStepped() override;
        std::vector<TargetPair> TargetPairs() override;
        std::vector<NamedNetwork> Networks() override;

        void Save(torch::serialize::OutputArchive& archive) override;
        void Load(torch::serialize::InputArchive& archive) override;

        float Alpha() const { return alpha_; }

    private:
        torch::Device device_;
        LearnerParam param_;
        float target_entropy_;
        float alpha_;
        torch::Tensor log_alpha_;
        GaussianActor pi_{ nullptr };
        DoubleCritic qvs_{ nullptr };
        DoubleCritic target_qvs_{ nullptr };
        std::unique_ptr<torch::optim::Adam> pi_optimizer_;
        std::unique_ptr<torch::optim::Adam> q1_optimizer_;
        std::unique_ptr<torch::optim::Adam> q2_optimizer_;
        std::unique_ptr<torch::optim::Adam> alpha_optimizer_;
    };

    // 学習器共通の小物
    namespace detail {
        // 単一状態 → (1, *shape) を device へ
        inline torch::Tensor AsBatch(const torch::Tensor& state, torch::Device device) {
            return state.detach().to(device, torch::kFloat).unsqueeze(0);
        }
        // 離散行動 (B, 1) float → (B, 1) long
        inline torch::Tensor ActionIndex(const torch::Tensor& action) {
            return action.to(torch::kLong).view({ -1, 1 });
        }
    } // namespace detail

} // namespace offrl::rl
