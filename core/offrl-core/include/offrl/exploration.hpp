#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace offrl::rl {

    // =============================================================
    // ε-greedy スケジュール（離散行動）
    // =============================================================

    enum class EpsilonDecay { Exponential, Linear };

    struct EpsilonScheduleOptions {
        EpsilonDecay decay = EpsilonDecay::Linear;
        float start = 1.0f;
        float end = 0.05f;               // ε_min（下限）
        float factor = 0.999f;           // Exponential: ε ← max(ε * factor, end)
        int64_t annealing_steps = 2000;  // Linear: start → end を annealing_steps 回で
    };

    /**
     * @brief 単調非増加で end を下回らない ε。Step() は探索行動1回ごとに呼ぶ。
     */
    class EpsilonSchedule {
    public:
        explicit EpsilonSchedule(const EpsilonScheduleOptions& options = EpsilonScheduleOptions());

        float Value() const { return value_; }
        float Step();           // 1ステップ進めて新しい ε を返す
        void Restart();         // start に戻す（チェックポイント復元時は SetSteps）
        void SetSteps(int64_t steps);
        int64_t Steps() const { return steps_; }
        const EpsilonScheduleOptions& Options() const { return options_; }

    private:
        float Evaluate(int64_t steps) const;

        EpsilonScheduleOptions options_;
        int64_t steps_ = 0;
        float value_;
    };

    // =============================================================
    // 連続行動用ノイズ源
    // =============================================================

    struct NoiseOptions {
        int64_t dim = 1;
        float mean = 0.0f;
        float sigma = 0.2f;
        float sigma_min = 0.0f;
        int64_t n_step_annealing = 0;   // 0 なら sigma 固定
        float theta = 0.15f;            // OU のみ
        float dt = 1e-2f;               // OU のみ
        uint64_t seed = 1337;
    };

    class NoiseSource {
    public:
        virtual ~NoiseSource() = default;
        // (dim,) の摂動
        virtual torch::Tensor Sample() = 0;
        virtual void Reset() = 0;
        virtual float Sigma() const = 0;
    };

    /**
     * @brief 独立ガウスノイズ N(mean, sigma²)。sigma は n_step_annealing 回で sigma_min まで線形減衰。
     */
    class GaussianNoise : public NoiseSource {
    public:
        explicit GaussianNoise(const NoiseOptions& options);

        torch::Tensor Sample() override;
        void Reset() override {}
        float Sigma() const override { return sigma_; }

        // (B, dim) を一度に引く（TD3 のターゲット平滑化用）
        torch::Tensor SampleBatch(int64_t batch);

    protected:
        void Anneal();
        float Normal() { return normal_(rng_); }

        NoiseOptions options_;
        float sigma_;
        float sigma_decrement_ = 0.0f;
        std::mt19937_64 rng_;
        std::normal_distribution<float> normal_{ 0.0f, 1.0f };
    };

    /**
     * @brief Ornstein-Uhlenbeck 過程 dx = θ(μ - x)dt + σ√dt N(0,1)。Reset() で x = μ。
     */
    class OUNoise : public GaussianNoise {
    public:
        explicit OUNoise(const NoiseOptions& options);

        torch::Tensor Sample() override;
        void Reset() override;

    private:
        torch::Tensor state_;
    };

    // "gaussian" / "normal" / "ou"（それ以外は std::invalid_argument）
    std::unique_ptr<NoiseSource> MakeNoise(const std::string& type, const NoiseOptions& options);

} // namespace offrl::rl
