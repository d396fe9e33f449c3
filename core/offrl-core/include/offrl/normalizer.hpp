#pragma once
#include <torch/torch.h>
#include <vector>

namespace offrl::rl {

    /**
     * @brief 状態用の逐次平均・分散（Welford）正規化器。
     * 出力は [-clip, clip] に丸める。統計は checkpoint に保存する。
     */
    class RunningNormalizer {
    public:
        explicit RunningNormalizer(std::vector<int64_t> shape, float clip = 5.0f, float eps = 1e-8f);

        // x: (*shape) もしくは (B, *shape)
        void Update(const torch::Tensor& x);
        torch::Tensor Normalize(const torch::Tensor& x) const;
        torch::Tensor operator()(const torch::Tensor& x) const { return Normalize(x); }

        torch::Tensor Mean() const { return mean_; }
        torch::Tensor Variance() const;
        double Count() const { return count_; }
        const std::vector<int64_t>& Shape() const { return shape_; }

        void Save(torch::serialize::OutputArchive& archive) const;
        void Load(torch::serialize::InputArchive& archive);

    private:
        std::vector<int64_t> shape_;
        float clip_;
        float eps_;
        double count_ = 0.0;
        torch::Tensor mean_;    // double, CPU
        torch::Tensor m2_;      // Σ (x - mean)²
    };

} // namespace offrl::rl
