#include "offrl/normalizer.hpp"
#include <stdexcept>
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    RunningNormalizer::RunningNormalizer(std::vector<int64_t> shape, float clip, float eps)
        : shape_(std::move(shape)), clip_(clip), eps_(eps)
    {
        if (shape_.empty())
            throw std::invalid_argument("RunningNormalizer: shape is empty");
        if (clip_ <= 0.0f)
            throw std::invalid_argument("RunningNormalizer: clip must be positive, got " + std::to_string(clip_));
        mean_ = torch::zeros(shape_, torch::kDouble);
        m2_ = torch::zeros(shape_, torch::kDouble);
    }

    void RunningNormalizer::Update(const torch::Tensor& x) {
        const int64_t n = util::NumElements(shape_);
        if (x.numel() == 0 || x.numel() % n != 0) {
            throw std::invalid_argument("RunningNormalizer: cannot reshape " + util::ShapeToString(x.sizes().vec()) +
                " into rows of " + util::ShapeToString(shape_));
        }
        auto rows = x.detach().to(torch::kCPU, torch::kDouble).reshape(util::PrependDim(-1, shape_));

        // Chan らの並列更新（バッチ単位の Welford）
        const double b = static_cast<double>(rows.size(0));
        auto batch_mean = rows.mean(0);
        auto batch_m2 = (rows - batch_mean).pow(2).sum(0);
        const double total = count_ + b;
        auto delta = batch_mean - mean_;
        mean_ = mean_ + delta * (b / total);
        m2_ = m2_ + batch_m2 + delta.pow(2) * (count_ * b / total);
        count_ = total;
    }

    torch::Tensor RunningNormalizer::Variance() const {
        if (count_ < 2.0) return torch::ones(shape_, torch::kDouble);
        return m2_ / count_;
    }

    torch::Tensor RunningNormalizer::Normalize(const torch::Tensor& x) const {
        auto mean = mean_.to(x.device(), x.scalar_type());
        auto sigma = (Variance() + eps_).sqrt().to(x.device(), x.scalar_type());
        return ((x - mean) / sigma).clamp(-clip_, clip_);
    }

    void RunningNormalizer::Save(torch::serialize::OutputArchive& archive) const {
        archive.write("mean", mean_, /*is_buffer=*/true);
        archive.write("m2", m2_, /*is_buffer=*/true);
        archive.write("count", torch::tensor(count_, torch::kDouble), /*is_buffer=*/true);
    }

    void RunningNormalizer::Load(torch::serialize::InputArchive& archive) {
        torch::Tensor mean, m2, count;
        archive.read("mean", mean, /*is_buffer=*/true);
        archive.read("m2", m2, /*is_buffer=*/true);
        archive.read("count", count, /*is_buffer=*/true);
        if (mean.sizes().vec() != shape_) {
            throw std::invalid_argument("RunningNormalizer: checkpoint shape " + util::ShapeToString(mean.sizes().vec()) +
                " does not match " + util::ShapeToString(shape_));
        }
        mean_ = mean.to(torch::kCPU, torch::kDouble);
        m2_ = m2.to(torch::kCPU, torch::kDouble);
        count_ = count.item<double>();
    }

} // namespace offrl::rl
