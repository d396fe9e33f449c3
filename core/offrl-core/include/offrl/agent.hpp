#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "offrl/checkpoint.hpp"
#include "offrl/ema_filter.hpp"
#include "offrl/exploration.hpp"
#include "offrl/learner.hpp"
#include "offrl/metrics_logger.hpp"
#include "offrl/normalizer.hpp"
#include "offrl/properties.hpp"
#include "offrl/replay_memory.hpp"
#include "offrl/rl.hpp"
#include "offrl/rollout.hpp"
#include "offrl/target_sync.hpp"

namespace offrl::rl {

    enum class AgentPhase { WarmingUp, Training };

    /**
     * @brief オフポリシー学習の共通ループ（act → observe → update）。
     *
     * エージェント固有の計算は Learner に委譲し、ここでは
     * 経験の保存（n-step 含む）、ウォームアップ判定、探索、optimizer の step、
     * 勾配クリップ、ターゲット同期、チェックポイントを扱う。
     */
    class OffPolicyAgent {
    public:
        // ==== ハイパーパラメータ（既定値は cartpole_c51_dqn 相当）====
        struct Param {
            float discount_factor = 0.99f;
            int n_step = 1;
            int batch_size = 32;
            float reward_scaling = 1.0f;
            int warm_up_steps = 1000;
            float polyak_factor = 0.0f;         // > 0 で soft update
            int target_update_frequency = 100;  // hard update 周期
            int update_frequency = 1;           // 何環境ステップごとに更新するか
            int update_steps = 1;               // 1回あたりの更新回数
            int policy_update_frequency = 1;    // Actor 更新とターゲット同期の間引き（TD3 は 2）

            // 離散行動の ε-greedy
            std::string epsilon_decay = "linear";   // "linear" / "exponential"
            float epsilon_start = 1.0f;
            float epsilon_end = 0.05f;
            float epsilon_decay_factor = 0.999f;
            int64_t epsilon_annealing_steps = 2000;

            // 連続行動の探索ノイズ
            std::string noise_type = "ou";          // "gaussian" / "ou"
            float noise_mean = 0.0f;
            float noise_sigma = 0.2f;
            float noise_sigma_min = 0.0f;
            int64_t noise_annealing_steps = 0;
            float noise_theta = 0.15f;
            float noise_dt = 1e-2f;

            int64_t memory_capacity = 100000;
            bool combined = false;

            bool state_normalization = false;
            float state_norm_clip = 5.0f;

            int64_t seed = 1337;

            Param() = default;
            Param(const Properties* props, const std::string& preset);

            nlohmann::json ToJson() const;
        };

        OffPolicyAgent(const Param& param, std::unique_ptr<Learner> learner,
            std::vector<int64_t> state_shape, const ActionSpaceInfo& action,
            torch::Device device = torch::kCPU, MetricsLogger* logger = nullptr);

        // state: 単一状態。explore=false なら常に貪欲（平均）行動
        torch::Tensor Act(const torch::Tensor& state, bool explore);

        // 1ステップ分の経験を保存する（n-step 時は窓が埋まってから）
        void Observe(const Experience& experience);

        // WarmingUp 中は何もせず false
        bool Update();

        // Observe して、update_frequency ごとに update_steps 回 Update する。実行した更新回数を返す
        int Step(const Experience& experience);

        std::filesystem::path Save(const CheckpointStore& store);
        bool Load(const CheckpointStore& store);

        AgentPhase Phase() const { return phase_; }
        bool IsTraining() const { return phase_ == AgentPhase::Training; }
        int64_t EnvSteps() const { return env_steps_; }
        int64_t Updates() const { return updates_; }
        int64_t PolicyUpdates() const { return policy_updates_; }
        float Epsilon() const { return epsilon_.Value(); }
        float BootstrapDiscount() const { return bootstrap_discount_; }
        const ReplayMemory& Memory() const { return memory_; }
        Learner& GetLearner() { return *learner_; }
        const std::vector<TargetNetworkSynchronizer>& Synchronizers() const { return synchronizers_; }
        const RunningNormalizer* Normalizer() const { return normalizer_.get(); }
        const Param& GetParam() const { return param_; }

    private:
        float ApplyLoss(const LossTerm& term);
        void LogScalar(const std::string& tag, double value);

        Param param_;
        std::unique_ptr<Learner> learner_;
        std::vector<int64_t> state_shape_;
        ActionSpaceInfo action_;
        torch::Device device_;
        MetricsLogger* logger_;

        ReplayMemory memory_;
        std::optional<RolloutAccumulator> rollout_;
        std::vector<TargetNetworkSynchronizer> synchronizers_;
        EpsilonSchedule epsilon_;
        std::unique_ptr<NoiseSource> noise_;
        std::unique_ptr<RunningNormalizer> normalizer_;
        float bootstrap_discount_;

        AgentPhase phase_ = AgentPhase::WarmingUp;
        int64_t env_steps_ = 0;
        int64_t updates_ = 0;           // Training 中の Update() 呼び出し回数
        int64_t policy_updates_ = 0;
        std::mt19937_64 rng_;

        // 統計情報
        std::map<std::string, EmaFilter<float>> loss_ema_;
    };

} // namespace offrl::rl
