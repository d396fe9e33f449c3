#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>
#include "offrl/rl.hpp"
#include "offrl/ring_buffer.hpp"
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    struct ReplayMemoryOptions {
        int64_t capacity = 100000;
        std::vector<int64_t> state_shape;
        std::vector<int64_t> action_shape{ 1 };
        bool combined = false;      // 最新遷移を必ずバッチに含める（Combined Experience Replay）
        util::TensorContext storage = util::TensorContext(torch::kCPU);
        uint64_t seed = 1337;
    };

    /**
     * @brief state / action / reward / next_state / mask の5本の RingBuffer を束ねた遷移ストア。
     *
     * 5本は常に同時に進み、同じ Size を返す。Push と Sample は内部 mutex で直列化される。
     */
    class ReplayMemory {
    public:
        explicit ReplayMemory(const ReplayMemoryOptions& options);

        // 全フィールドを検証してから書き込む（途中失敗で一部だけ書かれることはない）
        void Push(const Transition& transition);
        void Push(const torch::Tensor& state, const torch::Tensor& action, float reward,
            const torch::Tensor& next_state, bool terminal);

        /**
         * @brief batch_size 個の遷移を復元抽出でサンプリングする。
         *
         * - 一様: [0, size) から一様抽出。size == 0 なら std::logic_error
         * - combined: batch_size-1 個を [0, size-1) から抽出し、最新 (size-1) を必ず1つ追加。
         *   size < 2 なら std::logic_error
         */
        Batch Sample(int64_t batch_size, torch::Device device = torch::kCPU);

        // 指定インデックスで組み立てる（テスト・デバッグ用）
        Batch Gather(const std::vector<int64_t>& indices, torch::Device device = torch::kCPU) const;

        void Reset();

        int64_t Size() const;
        int64_t Capacity() const { return options_.capacity; }
        bool Combined() const { return options_.combined; }
        const ReplayMemoryOptions& Options() const { return options_; }

    private:
        Batch GatherUnlocked(const torch::Tensor& indices, torch::Device device) const;

        ReplayMemoryOptions options_;
        RingBuffer state_buffer_;
        RingBuffer action_buffer_;
        RingBuffer reward_buffer_;
        RingBuffer next_state_buffer_;
        RingBuffer mask_buffer_;

        mutable std::mutex mutex_;
        std::mt19937_64 rng_;
    };

} // namespace offrl::rl
