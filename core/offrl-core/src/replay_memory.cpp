#include "offrl/replay_memory.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace offrl::rl {

    namespace {
        ReplayMemoryOptions Validate(const ReplayMemoryOptions& o) {
            if (o.state_shape.empty())
                throw std::invalid_argument("ReplayMemory: state_shape is empty");
            if (o.action_shape.empty())
                throw std::invalid_argument("ReplayMemory: action_shape is empty");
            // combined は最新以外から最低1つ選べる必要がある
            if (o.combined && o.capacity < 2)
                throw std::invalid_argument("ReplayMemory: combined sampling requires capacity >= 2, got " +
                    std::to_string(o.capacity));
            return o;
        }
    } // namespace

    ReplayMemory::ReplayMemory(const ReplayMemoryOptions& options)
        : options_(Validate(options)),
        state_buffer_(options.capacity, options.state_shape, options.storage),
        action_buffer_(options.capacity, options.action_shape, options.storage),
        reward_buffer_(options.capacity, { 1 }, options.storage),
        next_state_buffer_(options.capacity, options.state_shape, options.storage),
        mask_buffer_(options.capacity, { 1 }, options.storage),
        rng_(options.seed)
    {
    }

    void ReplayMemory::Push(const Transition& t) {
        // ---- 書き込み前に全フィールドを検証 ----
        state_buffer_.CheckValue(t.state);
        action_buffer_.CheckValue(t.action);
        next_state_buffer_.CheckValue(t.next_state);
        if (!std::isfinite(t.reward))
            throw std::invalid_argument("ReplayMemory: reward is not finite");
        if (t.mask != 0.0f && t.mask != 1.0f)
            throw std::invalid_argument("ReplayMemory: mask must be 0 or 1, got " + std::to_string(t.mask));

        std::lock_guard<std::mutex> lock(mutex_);
        state_buffer_.Add(t.state);
        action_buffer_.Add(t.action);
        reward_buffer_.Add(t.reward);
        next_state_buffer_.Add(t.next_state);
        mask_buffer_.Add(t.mask);
    }

    void ReplayMemory::Push(const torch::Tensor& state, const torch::Tensor& action, float reward,
        const torch::Tensor& next_state, bool terminal)
    {
        Push(Transition{ state, action, reward, next_state, terminal ? 0.0f : 1.0f });
    }

    Batch ReplayMemory::Sample(int64_t batch_size, torch::Device device) {
        if (batch_size < 1)
            throw std::invalid_argument("ReplayMemory: batch_size must be >= 1, got " + std::to_string(batch_size));

        std::lock_guard<std::mutex> lock(mutex_);
        const int64_t size = state_buffer_.Size();
        if (size == 0)
            throw std::logic_error("ReplayMemory: cannot sample from an empty memory");
        if (options_.combined && size < 2)
            throw std::logic_error("ReplayMemory: combined sampling requires at least 2 transitions, have " +
                std::to_string(size));

        std::vector<int64_t> idxs;
        idxs.reserve(batch_size);
        if (options_.combined) {
            std::uniform_int_distribution<int64_t> dist(0, size - 2);   // 最新を除外
            for (int64_t i = 0; i < batch_size - 1; ++i)
                idxs.push_back(dist(rng_));
            idxs.push_back(size - 1);
        } else {
            std::uniform_int_distribution<int64_t> dist(0, size - 1);
            for (int64_t i = 0; i < batch_size; ++i)
                idxs.push_back(dist(rng_));
        }
        return GatherUnlocked(torch::tensor(idxs, torch::kLong), device);
    }

    Batch ReplayMemory::Gather(const std::vector<int64_t>& indices, torch::Device device) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return GatherUnlocked(torch::tensor(indices, torch::kLong), device);
    }

    Batch ReplayMemory::GatherUnlocked(const torch::Tensor& indices, torch::Device device) const {
        Batch batch;
        batch.state = state_buffer_.Sample(indices, device);
        batch.action = action_buffer_.Sample(indices, device);
        batch.reward = reward_buffer_.Sample(indices, device);
        batch.next_state = next_state_buffer_.Sample(indices, device);
        batch.mask = mask_buffer_.Sample(indices, device);
        batch.indices = indices.clone();
        return batch;
    }

    void ReplayMemory::Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_buffer_.Reset();
        action_buffer_.Reset();
        reward_buffer_.Reset();
        next_state_buffer_.Reset();
        mask_buffer_.Reset();
    }

    int64_t ReplayMemory::Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_buffer_.Size();
    }

} // namespace offrl::rl
