#include "offrl/target_sync.hpp"
#include <stdexcept>
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    namespace {

        void CheckSameTopology(const torch::OrderedDict<std::string, torch::Tensor>& src,
            const torch::OrderedDict<std::string, torch::Tensor>& dst,
            const std::string& what, const std::string& name)
        {
            if (src.size() != dst.size()) {
                throw std::invalid_argument("TargetNetworkSynchronizer[" + name + "]: " + what + " count mismatch (" +
                    std::to_string(src.size()) + " vs " + std::to_string(dst.size()) + ")");
            }
            for (const auto& kv : src) {
                const auto* t = dst.find(kv.key());
                if (t == nullptr)
                    throw std::invalid_argument("TargetNetworkSynchronizer[" + name + "]: target has no " + what + " '" + kv.key() + "'");
                if (t->sizes() != kv.value().sizes()) {
                    throw std::invalid_argument("TargetNetworkSynchronizer[" + name + "]: shape mismatch for '" + kv.key() + "' " +
                        util::ShapeToString(kv.value().sizes().vec()) + " vs " + util::ShapeToString(t->sizes().vec()));
                }
            }
        }

    } // namespace

    TargetUpdateOptions TargetUpdateOptions::FromConfig(float polyak_factor, int64_t target_update_frequency) {
        TargetUpdateOptions o;
        if (polyak_factor > 0.0f) {
            o.mode = TargetUpdateMode::Soft;
            o.tau = polyak_factor;
        } else {
            o.mode = TargetUpdateMode::Hard;
            o.period = target_update_frequency;
        }
        return o;
    }

    TargetNetworkSynchronizer::TargetNetworkSynchronizer(std::shared_ptr<torch::nn::Module> live,
        std::shared_ptr<torch::nn::Module> target,
        const TargetUpdateOptions& options,
        std::string name)
        : live_(std::move(live)), target_(std::move(target)), options_(options), name_(std::move(name))
    {
        if (!live_ || !target_)
            throw std::invalid_argument("TargetNetworkSynchronizer[" + name_ + "]: null module");
        if (live_ == target_)
            throw std::invalid_argument("TargetNetworkSynchronizer[" + name_ + "]: live and target are the same module");
        if (options_.mode == TargetUpdateMode::Soft && !(options_.tau > 0.0f && options_.tau <= 1.0f))
            throw std::invalid_argument("TargetNetworkSynchronizer[" + name_ + "]: tau must be in (0, 1], got " + std::to_string(options_.tau));
        if (options_.mode == TargetUpdateMode::Hard && options_.period < 1)
            throw std::invalid_argument("TargetNetworkSynchronizer[" + name_ + "]: period must be >= 1, got " + std::to_string(options_.period));

        CheckSameTopology(live_->named_parameters(), target_->named_parameters(), "parameter", name_);
        CheckSameTopology(live_->named_buffers(), target_->named_buffers(), "buffer", name_);

        // target は勾配計算・optimizer の対象外
        for (auto& p : target_->parameters())
            p.set_requires_grad(false);

        // 初期同期：live → target
        HardCopy();
        target_->eval();
    }

    void TargetNetworkSynchronizer::Step() {
        calls_++;
        if (options_.mode == TargetUpdateMode::Soft) {
            SoftUpdate();
        } else if (calls_ % options_.period == 0) {
            HardCopy();
        }
    }

    void TargetNetworkSynchronizer::HardCopy() {
        torch::NoGradGuard no_grad;
        auto src = live_->named_parameters();
        auto dst = target_->named_parameters();
        for (auto& kv : src) {
            dst[kv.key()].copy_(kv.value());
        }
        auto src_buf = live_->named_buffers();
        auto dst_buf = target_->named_buffers();
        for (auto& kv : src_buf) {
            dst_buf[kv.key()].copy_(kv.value());
        }
    }

    void TargetNetworkSynchronizer::SoftUpdate() {
        if (options_.tau >= 1.0f) { HardCopy(); return; }  // liveを完全コピー
        torch::NoGradGuard no_grad;
        const float tau = options_.tau;
        auto src = live_->named_parameters();
        auto dst = target_->named_parameters();
        for (auto& kv : src) {
            auto& t = dst[kv.key()];
            t.mul_(1.0f - tau).add_(kv.value(), tau);
        }
        // バッファ（正規化統計など）は補間せずコピー
        auto src_buf = live_->named_buffers();
        auto dst_buf = target_->named_buffers();
        for (auto& kv : src_buf) {
            dst_buf[kv.key()].copy_(kv.value());
        }
    }

} // namespace offrl::rl
