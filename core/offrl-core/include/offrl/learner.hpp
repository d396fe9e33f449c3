#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "offrl/properties.hpp"
#include "offrl/rl.hpp"

namespace offrl::rl {

    // 閉じたエージェント種別の集合
    enum class AgentType { DQN, DoubleDQN, CategoricalDQN, QuantileDQN, DDPG, TD3, SAC, QuantileDDPG };

    // "dqn" / "double_dqn" / "categorical_dqn" / "quantile_dqn" / "ddpg" / "td3" / "sac" / "quantile_ddpg"
    AgentType ParseAgentType(const std::string& name);
    std::string ToString(AgentType type);
    bool IsDiscrete(AgentType type);

    // ==== 学習器のハイパーパラメータ ====
    struct LearnerParam {
        std::string hidden = "128";         // 隠れ層 "128,128"
        float learning_rate = 1e-3f;        // Q / Critic
        float actor_learning_rate = 1e-3f;
        float alpha_learning_rate = 3e-4f;  // SAC 温度
        float critic_grad_norm = 0.0f;      // 0 以下でクリップしない
        float actor_grad_norm = 0.0f;

        bool use_double_q = false;
        bool use_dueling = false;

        int support_dim = 51;               // C51 の atoms 数 / 分位点数
        float v_min = 0.0f;
        float v_max = 200.0f;
        float quantile_kappa = 1.0f;

        float critic_l2_reg = 0.0f;         // DDPG

        float target_noise_std = 0.2f;      // TD3 ターゲット平滑化
        float target_noise_limit = 0.5f;

        bool alpha_tuning = true;           // SAC
        float alpha = 1.0f;                 // SAC 初期温度

        int64_t seed = 1337;

        LearnerParam() = default;
        LearnerParam(const Properties* props, const std::string& preset);

        nlohmann::json ToJson() const;
    };

    struct LearnerSpaces {
        int64_t state_dim = 0;
        ActionSpaceInfo action;
        torch::Device device = torch::kCPU;
    };

    /**
     * @brief 1つの損失と、それを適用する optimizer / クリップ対象パラメータの組。
     * zero_grad → backward → clip → step はループ側で行う。
     */
    struct LossTerm {
        std::string tag;
        torch::Tensor loss;
        torch::optim::Optimizer* optimizer = nullptr;
        std::vector<torch::Tensor> params;
        float grad_clip = 0.0f;
    };

    struct TargetPair {
        std::string name;
        std::shared_ptr<torch::nn::Module> live;
        std::shared_ptr<torch::nn::Module> target;
    };

    struct NamedNetwork {
        std::string name;
        std::shared_ptr<torch::nn::Module> module;
    };

    /**
     * @brief エージェント固有の計算（行動選択・ターゲット・損失）だけを持つ戦略。
     * 経験の保存、更新の頻度、optimizer の step、ターゲット同期は OffPolicyAgent が行う。
     */
    class Learner {
    public:
        virtual ~Learner() = default;

        virtual AgentType Type() const = 0;
        virtual bool HasActor() const { return false; }
        // 自身の方策分布からサンプルして探索する（加法ノイズ・ε を使わない）
        virtual bool Stochastic() const { return false; }

        // state: 単一状態 (*state_shape)。離散は (1,) long、連続は (action_dim,) float を CPU で返す
        virtual torch::Tensor SelectAction(const torch::Tensor& state, bool explore) = 0;

        // 勾配を持たないブートストラップターゲット。discount は γ^n
        virtual torch::Tensor ComputeTarget(const Batch& batch, float discount) = 0;
        virtual std::vector<LossTerm> CriticLosses(const Batch& batch, const torch::Tensor& target) = 0;
        // Critic 更新後に呼ばれる
        virtual std::vector<LossTerm> ActorLosses(const Batch&) { return {}; }
        virtual void OnActorStepped() {}

        virtual std::vector<TargetPair> TargetPairs() = 0;
        virtual std::vector<NamedNetwork> Networks() = 0;

        // networks/<name> に各ネットワークを保存する
        virtual void Save(torch::serialize::OutputArchive& archive);
        virtual void Load(torch::serialize::InputArchive& archive);
    };

    std::unique_ptr<Learner> MakeLearner(AgentType type, const LearnerSpaces& spaces, const LearnerParam& param);

} // namespace offrl::rl
