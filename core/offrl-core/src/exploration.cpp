#include "offrl/exploration.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace offrl::rl {

    // =============================================================
    // EpsilonSchedule
    // =============================================================

    EpsilonSchedule::EpsilonSchedule(const EpsilonScheduleOptions& options)
        : options_(options)
    {
        if (!(options_.start >= 0.0f && options_.start <= 1.0f))
            throw std::invalid_argument("EpsilonSchedule: start must be in [0, 1], got " + std::to_string(options_.start));
        if (!(options_.end >= 0.0f && options_.end <= options_.start))
            throw std::invalid_argument("EpsilonSchedule: end must be in [0, start], got " + std::to_string(options_.end));
        if (options_.decay == EpsilonDecay::Exponential && !(options_.factor > 0.0f && options_.factor <= 1.0f))
            throw std::invalid_argument("EpsilonSchedule: factor must be in (0, 1], got " + std::to_string(options_.factor));
        if (options_.decay == EpsilonDecay::Linear && options_.annealing_steps < 1)
            throw std::invalid_argument("EpsilonSchedule: annealing_steps must be >= 1, got " +
                std::to_string(options_.annealing_steps));
        value_ = options_.start;
    }

    float EpsilonSchedule::Evaluate(int64_t steps) const {
        if (options_.decay == EpsilonDecay::Linear) {
            const float frac = std::min(1.0f, static_cast<float>(steps) / static_cast<float>(options_.annealing_steps));
            return std::max(options_.end, options_.start + (options_.end - options_.start) * frac);
        }
        const float v = options_.start * std::pow(options_.factor, static_cast<float>(steps));
        return std::max(options_.end, v);
    }

    float EpsilonSchedule::Step() {
        steps_++;
        if (options_.decay == EpsilonDecay::Exponential) {
            value_ = std::max(value_ * options_.factor, options_.end);
        } else {
            value_ = std::min(value_, Evaluate(steps_));   // 丸め誤差でも増加しない
        }
        return value_;
    }

    void EpsilonSchedule::Restart() {
        steps_ = 0;
        value_ = options_.start;
    }

    void EpsilonSchedule::SetSteps(int64_t steps) {
        if (steps < 0)
            throw std::invalid_argument("EpsilonSchedule: steps must be >= 0, got " + std::to_string(steps));
        steps_ = steps;
        value_ = Evaluate(steps_);
    }

    // =============================================================
    // GaussianNoise / OUNoise
    // =============================================================

    GaussianNoise::GaussianNoise(const NoiseOptions& options)
        : options_(options), sigma_(options.sigma), rng_(options.seed)
    {
        if (options_.dim < 1)
            throw std::invalid_argument("NoiseSource: dim must be >= 1, got " + std::to_string(options_.dim));
        if (options_.sigma < 0.0f || options_.sigma_min < 0.0f)
            throw std::invalid_argument("NoiseSource: sigma must be non-negative");
        if (options_.n_step_annealing > 0)
            sigma_decrement_ = std::max(0.0f, options_.sigma - options_.sigma_min) / static_cast<float>(options_.n_step_annealing);
    }

    void GaussianNoise::Anneal() {
        if (sigma_decrement_ > 0.0f)
            sigma_ = std::max(options_.sigma_min, sigma_ - sigma_decrement_);
    }

    torch::Tensor GaussianNoise::Sample() {
        auto out = torch::empty({ options_.dim }, torch::kFloat);
        auto acc = out.accessor<float, 1>();
        for (int64_t i = 0; i < options_.dim; ++i)
            acc[i] = options_.mean + sigma_ * Normal();
        Anneal();
        return out;
    }

    torch::Tensor GaussianNoise::SampleBatch(int64_t batch) {
        auto out = torch::empty({ batch, options_.dim }, torch::kFloat);
        auto acc = out.accessor<float, 2>();
        for (int64_t b = 0; b < batch; ++b)
            for (int64_t i = 0; i < options_.dim; ++i)
                acc[b][i] = options_.mean + sigma_ * Normal();
        return out;
    }

    OUNoise::OUNoise(const NoiseOptions& options)
        : GaussianNoise(options)
    {
        if (options_.dt <= 0.0f)
            throw std::invalid_argument("OUNoise: dt must be positive, got " + std::to_string(options_.dt));
        Reset();
    }

    torch::Tensor OUNoise::Sample() {
        auto acc = state_.accessor<float, 1>();
        const float sqrt_dt = std::sqrt(options_.dt);
        for (int64_t i = 0; i < options_.dim; ++i) {
            acc[i] += options_.theta * (options_.mean - acc[i]) * options_.dt + sigma_ * sqrt_dt * Normal();
        }
        Anneal();
        return state_.clone();
    }

    void OUNoise::Reset() {
        state_ = torch::full({ options_.dim }, options_.mean, torch::kFloat);
    }

    std::unique_ptr<NoiseSource> MakeNoise(const std::string& type, const NoiseOptions& options) {
        if (type == "gaussian" || type == "normal")
            return std::make_unique<GaussianNoise>(options);
        if (type == "ou")
            return std::make_unique<OUNoise>(options);
        throw std::invalid_argument("MakeNoise: unknown noise type '" + type + "'");
    }

} // namespace offrl::rl
