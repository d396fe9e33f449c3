#pragma once
#include <torch/torch.h>
#include <vector>
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    /**
     * @brief 1フィールド分（state, action, reward, ...）の固定長リングバッファ。
     *
     * 保存領域は (capacity, *shape) の密テンソル1本。論理スロット i は
     * 物理スロット (head_ + i) % capacity にあり、スロット0が最古、size-1 が最新。
     * 満杯時の Add は最古を1要素分だけ上書きする（全体のシフトはしない）。
     */
    class RingBuffer {
    public:
        RingBuffer(int64_t capacity, std::vector<int64_t> shape,
            const util::TensorContext& ctx = util::TensorContext());

        // value の要素数が shape と一致しない場合は std::invalid_argument
        void Add(const torch::Tensor& value);
        void Add(float value);

        // 論理インデックスで取り出す。戻り値は常にコピー（バッファとは別領域）。
        // 範囲外は std::out_of_range
        torch::Tensor Sample(const torch::Tensor& indices, torch::Device device = torch::kCPU) const;
        torch::Tensor Sample(const std::vector<int64_t>& indices, torch::Device device = torch::kCPU) const;

        torch::Tensor At(int64_t index) const;
        torch::Tensor First() const { return At(0); }
        torch::Tensor Last() const { return At(size_ - 1); }

        void Reset();

        int64_t Size() const { return size_; }
        int64_t Capacity() const { return capacity_; }
        bool Full() const { return size_ == capacity_; }
        bool Empty() const { return size_ == 0; }
        const std::vector<int64_t>& Shape() const { return shape_; }

        // 追加前の形状チェックのみ（ReplayMemory の一括検証用）
        void CheckValue(const torch::Tensor& value) const;

    private:
        int64_t Physical(int64_t logical) const { return (head_ + logical) % capacity_; }

        int64_t capacity_;
        std::vector<int64_t> shape_;
        util::TensorContext ctx_;
        torch::Tensor container_;   // (capacity, *shape)
        int64_t head_ = 0;          // 論理スロット0の物理位置
        int64_t size_ = 0;
    };

} // namespace offrl::rl
