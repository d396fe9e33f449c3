#include "offrl/ring_buffer.hpp"
#include <stdexcept>
#include <string>

namespace offrl::rl {

    RingBuffer::RingBuffer(int64_t capacity, std::vector<int64_t> shape, const util::TensorContext& ctx)
        : capacity_(capacity), shape_(std::move(shape)), ctx_(ctx)
    {
        if (capacity_ < 1)
            throw std::invalid_argument("RingBuffer: capacity must be >= 1, got " + std::to_string(capacity_));
        for (auto d : shape_) {
            if (d < 1)
                throw std::invalid_argument("RingBuffer: invalid element shape " + util::ShapeToString(shape_));
        }
        torch::NoGradGuard no_grad;
        container_ = torch::zeros(util::PrependDim(capacity_, shape_), ctx_.FloatOpt());
    }

    void RingBuffer::CheckValue(const torch::Tensor& value) const {
        if (!value.defined())
            throw std::invalid_argument("RingBuffer: undefined tensor");
        if (value.numel() != util::NumElements(shape_)) {
            throw std::invalid_argument("RingBuffer: value has " + std::to_string(value.numel()) +
                " elements, expected shape " + util::ShapeToString(shape_));
        }
    }

    void RingBuffer::Add(const torch::Tensor& value) {
        CheckValue(value);
        torch::NoGradGuard no_grad;

        int64_t slot;
        if (size_ < capacity_) {
            slot = Physical(size_);
            size_++;
        } else {
            // 最古（論理0）を上書きし、先頭を1つ進める
            slot = head_;
            head_ = (head_ + 1) % capacity_;
        }
        container_[slot].copy_(value.detach().reshape(shape_).to(ctx_.device, ctx_.float_dtype));
    }

    void RingBuffer::Add(float value) {
        Add(torch::full(shape_, value, torch::kFloat));
    }

    torch::Tensor RingBuffer::Sample(const torch::Tensor& indices, torch::Device device) const {
        torch::NoGradGuard no_grad;
        auto idx = indices.to(torch::kCPU, torch::kLong).reshape({ -1 });
        if (idx.numel() > 0) {
            auto lo = idx.min().item<int64_t>();
            auto hi = idx.max().item<int64_t>();
            if (lo < 0 || hi >= size_) {
                throw std::out_of_range("RingBuffer: index out of range [0, " + std::to_string(size_) +
                    "): min=" + std::to_string(lo) + " max=" + std::to_string(hi));
            }
        }
        auto phys = (idx + head_).remainder(capacity_).to(ctx_.device);
        // index_select は新しい領域を確保する → 後続の Add に影響されない
        return container_.index_select(0, phys).to(device);
    }

    torch::Tensor RingBuffer::Sample(const std::vector<int64_t>& indices, torch::Device device) const {
        auto idx = torch::tensor(indices, torch::kLong);
        return Sample(idx, device);
    }

    torch::Tensor RingBuffer::At(int64_t index) const {
        if (index < 0 || index >= size_)
            throw std::out_of_range("RingBuffer: index " + std::to_string(index) +
                " out of range [0, " + std::to_string(size_) + ")");
        return container_[Physical(index)].clone();
    }

    void RingBuffer::Reset() {
        head_ = 0;
        size_ = 0;
    }

} // namespace offrl::rl
