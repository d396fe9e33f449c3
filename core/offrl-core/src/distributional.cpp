#include "offrl/distributional.hpp"
#include <stdexcept>
#include <string>
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    CategoricalProjector::CategoricalProjector(int64_t atoms, float v_min, float v_max, torch::Device device)
        : atoms_(atoms), v_min_(v_min), v_max_(v_max)
    {
        if (atoms_ < 2)
            throw std::invalid_argument("CategoricalProjector: atoms must be >= 2, got " + std::to_string(atoms_));
        if (!(v_max_ > v_min_))
            throw std::invalid_argument("CategoricalProjector: v_max must be greater than v_min (" +
                std::to_string(v_min_) + ", " + std::to_string(v_max_) + ")");
        delta_z_ = (v_max_ - v_min_) / static_cast<float>(atoms_ - 1);
        support_ = torch::linspace(v_min_, v_max_, atoms_, torch::TensorOptions().dtype(torch::kFloat).device(device));
    }

    torch::Tensor CategoricalProjector::Project(const torch::Tensor& next_probs, const torch::Tensor& reward,
        const torch::Tensor& mask, float discount) const
    {
        if (next_probs.dim() != 2 || next_probs.size(1) != atoms_) {
            throw std::invalid_argument("CategoricalProjector: next_probs must be (B, " + std::to_string(atoms_) +
                "), got " + util::ShapeToString(next_probs.sizes().vec()));
        }
        const int64_t B = next_probs.size(0);
        if (reward.numel() != B || mask.numel() != B) {
            throw std::invalid_argument("CategoricalProjector: reward/mask must have " + std::to_string(B) +
                " elements, got " + std::to_string(reward.numel()) + "/" + std::to_string(mask.numel()));
        }

        torch::NoGradGuard no_grad;
        const auto dev = next_probs.device();
        auto probs = next_probs.detach().to(torch::kFloat);
        auto r = reward.detach().to(dev, torch::kFloat).reshape({ B, 1 });
        auto m = mask.detach().to(dev, torch::kFloat).reshape({ B, 1 });
        auto z = support_.to(dev).unsqueeze(0);                                  // (1, atoms)

        // ずらしたサポートを格子座標へ
        auto tz = (r + m * discount * z).clamp(v_min_, v_max_);                  // (B, atoms)
        auto b = (tz - v_min_) / delta_z_;
        auto l = b.floor().to(torch::kLong).clamp(0, atoms_ - 1);
        auto u = b.ceil().to(torch::kLong).clamp(0, atoms_ - 1);

        // floor == ceil のときは下側へ全質量（(u - b) = 0 なので +1 で補う）
        auto same = (l == u).to(torch::kFloat);
        auto m_l = probs * (u.to(torch::kFloat) - b + same);
        auto m_u = probs * (b - l.to(torch::kFloat));

        auto offset = (torch::arange(B, torch::TensorOptions().dtype(torch::kLong).device(dev)) * atoms_)
            .unsqueeze(1).expand({ B, atoms_ });
        auto projected = torch::zeros({ B * atoms_ }, probs.options());
        projected.index_add_(0, (l + offset).reshape({ -1 }), m_l.reshape({ -1 }));
        projected.index_add_(0, (u + offset).reshape({ -1 }), m_u.reshape({ -1 }));
        return projected.view({ B, atoms_ });
    }

} // namespace offrl::rl
