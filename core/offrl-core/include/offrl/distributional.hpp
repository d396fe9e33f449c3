#pragma once
#include <torch/torch.h>
#include <cstdint>

namespace offrl::rl {

    /**
     * @brief カテゴリカル分布（C51）の Bellman 射影。
     *
     * 固定サポート z_i = v_min + i Δz (i = 0..atoms-1) 上の次状態分布を
     * Tz = clamp(r + mask γ z, v_min, v_max) にずらし、両隣の格子点へ距離に比例して配分し直す。
     * Tz がちょうど格子点に乗る場合（floor == ceil）は全質量をその点に置く。
     */
    class CategoricalProjector {
    public:
        CategoricalProjector(int64_t atoms, float v_min, float v_max, torch::Device device = torch::kCPU);

        // next_probs (B, atoms), reward (B, 1), mask (B, 1) → (B, atoms)。各行の総和は 1 を保つ
        torch::Tensor Project(const torch::Tensor& next_probs, const torch::Tensor& reward,
            const torch::Tensor& mask, float discount) const;

        const torch::Tensor& Support() const { return support_; }   // (atoms,)
        int64_t Atoms() const { return atoms_; }
        float VMin() const { return v_min_; }
        float VMax() const { return v_max_; }
        float DeltaZ() const { return delta_z_; }

    private:
        int64_t atoms_;
        float v_min_;
        float v_max_;
        float delta_z_;
        torch::Tensor support_;
    };

} // namespace offrl::rl
