#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>

namespace offrl::rl {

    enum class TargetUpdateMode { Soft, Hard };

    struct TargetUpdateOptions {
        TargetUpdateMode mode = TargetUpdateMode::Hard;
        float tau = 0.005f;         // Soft: θ_target ← τ θ_live + (1-τ) θ_target
        int64_t period = 100;       // Hard: period 回に1回 完全コピー

        // polyak_factor > 0 なら Soft(τ=polyak_factor)、それ以外は Hard(period)
        static TargetUpdateOptions FromConfig(float polyak_factor, int64_t target_update_frequency);
    };

    /**
     * @brief live ネットワークの target コピーを管理する。
     *
     * 生成時に live → target を完全コピーし、target のパラメータは requires_grad=false にする。
     * 以後 target を書き換えるのは Step()/HardCopy() のみ。
     * パラメータ名・形状が一致しない組み合わせは生成時に std::invalid_argument。
     */
    class TargetNetworkSynchronizer {
    public:
        TargetNetworkSynchronizer(std::shared_ptr<torch::nn::Module> live,
            std::shared_ptr<torch::nn::Module> target,
            const TargetUpdateOptions& options,
            std::string name = "");

        void Step();
        void HardCopy();

        int64_t Calls() const { return calls_; }
        const std::string& Name() const { return name_; }
        const TargetUpdateOptions& Options() const { return options_; }
        const std::shared_ptr<torch::nn::Module>& Live() const { return live_; }
        const std::shared_ptr<torch::nn::Module>& Target() const { return target_; }

    private:
        void SoftUpdate();

        std::shared_ptr<torch::nn::Module> live_;
        std::shared_ptr<torch::nn::Module> target_;
        TargetUpdateOptions options_;
        std::string name_;
        int64_t calls_ = 0;
    };

} // namespace offrl::rl
