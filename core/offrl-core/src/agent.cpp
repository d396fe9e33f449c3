#include "offrl/agent.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <wx/log.h>
#include "offrl/tensor_utils.hpp"

namespace offrl::rl {

    const float met_ema_decay = 0.005f;  // 平滑化係数(メトリクス用)

    namespace {

        const OffPolicyAgent::Param& Validate(const OffPolicyAgent::Param& p) {
            if (!(p.discount_factor >= 0.0f && p.discount_factor <= 1.0f))
                throw std::invalid_argument("OffPolicyAgent: discount_factor must be in [0, 1], got " + std::to_string(p.discount_factor));
            if (p.n_step < 1)
                throw std::invalid_argument("OffPolicyAgent: n_step must be >= 1, got " + std::to_string(p.n_step));
            if (p.batch_size < 1)
                throw std::invalid_argument("OffPolicyAgent: batch_size must be >= 1, got " + std::to_string(p.batch_size));
            if (p.warm_up_steps < 0)
                throw std::invalid_argument("OffPolicyAgent: warm_up_steps must be >= 0, got " + std::to_string(p.warm_up_steps));
            if (p.update_frequency < 1 || p.update_steps < 1 || p.policy_update_frequency < 1)
                throw std::invalid_argument("OffPolicyAgent: update_frequency, update_steps and policy_update_frequency must be >= 1");
            if (!std::isfinite(p.reward_scaling))
                throw std::invalid_argument("OffPolicyAgent: reward_scaling is not finite");
            return p;
        }

        EpsilonScheduleOptions EpsilonOptions(const OffPolicyAgent::Param& p) {
            EpsilonScheduleOptions o;
            if (p.epsilon_decay == "linear") {
                o.decay = EpsilonDecay::Linear;
            } else if (p.epsilon_decay == "exponential") {
                o.decay = EpsilonDecay::Exponential;
            } else {
                throw std::invalid_argument("OffPolicyAgent: unknown epsilon_decay '" + p.epsilon_decay + "'");
            }
            o.start = p.epsilon_start;
            o.end = p.epsilon_end;
            o.factor = p.epsilon_decay_factor;
            o.annealing_steps = p.epsilon_annealing_steps;
            return o;
        }

        ReplayMemoryOptions MemoryOptions(const OffPolicyAgent::Param& p, const std::vector<int64_t>& state_shape,
            const ActionSpaceInfo& action)
        {
            ReplayMemoryOptions o;
            o.capacity = p.memory_capacity;
            o.state_shape = state_shape;
            o.action_shape = { action.discrete ? 1 : action.n };
            o.combined = p.combined;
            o.seed = static_cast<uint64_t>(p.seed);
            return o;
        }

    } // namespace

    // ======================================================
    // Param
    // ======================================================
    OffPolicyAgent::Param::Param(const Properties* props, const std::string& preset) {
        if (props == nullptr) return;
        OFFRL_READ_PROPS(props, preset, discount_factor);
        OFFRL_READ_PROPS(props, preset, n_step);
        OFFRL_READ_PROPS(props, preset, batch_size);
        OFFRL_READ_PROPS(props, preset, reward_scaling);
        OFFRL_READ_PROPS(props, preset, warm_up_steps);
        OFFRL_READ_PROPS(props, preset, polyak_factor);
        OFFRL_READ_PROPS(props, preset, target_update_frequency);
        OFFRL_READ_PROPS(props, preset, update_frequency);
        OFFRL_READ_PROPS(props, preset, update_steps);
        OFFRL_READ_PROPS(props, preset, policy_update_frequency);
        OFFRL_READ_PROPS(props, preset, epsilon_decay);
        OFFRL_READ_PROPS(props, preset, epsilon_start);
        OFFRL_READ_PROPS(props, preset, epsilon_end);
        OFFRL_READ_PROPS(props, preset, epsilon_decay_factor);
        OFFRL_READ_PROPS(props, preset, epsilon_annealing_steps);
        OFFRL_READ_PROPS(props, preset, noise_type);
        OFFRL_READ_PROPS(props, preset, noise_mean);
        OFFRL_READ_PROPS(props, preset, noise_sigma);
        OFFRL_READ_PROPS(props, preset, noise_sigma_min);
        OFFRL_READ_PROPS(props, preset, noise_annealing_steps);
        OFFRL_READ_PROPS(props, preset, noise_theta);
        OFFRL_READ_PROPS(props, preset, noise_dt);
        OFFRL_READ_PROPS(props, preset, memory_capacity);
        OFFRL_READ_PROPS(props, preset, combined);
        OFFRL_READ_PROPS(props, preset, state_normalization);
        OFFRL_READ_PROPS(props, preset, state_norm_clip);
        OFFRL_READ_PROPS(props, preset, seed);
    }

    nlohmann::json OffPolicyAgent::Param::ToJson() const {
        return {
            {"discount_factor", discount_factor},
            {"n_step", n_step},
            {"batch_size", batch_size},
            {"reward_scaling", reward_scaling},
            {"warm_up_steps", warm_up_steps},
            {"polyak_factor", polyak_factor},
            {"target_update_frequency", target_update_frequency},
            {"update_frequency", update_frequency},
            {"update_steps", update_steps},
            {"policy_update_frequency", policy_update_frequency},
            {"epsilon_decay", epsilon_decay},
            {"epsilon_start", epsilon_start},
            {"epsilon_end", epsilon_end},
            {"epsilon_decay_factor", epsilon_decay_factor},
            {"epsilon_annealing_steps", epsilon_annealing_steps},
            {"noise_type", noise_type},
            {"noise_mean", noise_mean},
            {"noise_sigma", noise_sigma},
            {"noise_sigma_min", noise_sigma_min},
            {"noise_annealing_steps", noise_annealing_steps},
            {"noise_theta", noise_theta},
            {"noise_dt", noise_dt},
            {"memory_capacity", memory_capacity},
            {"combined", combined},
            {"state_normalization", state_normalization},
            {"state_norm_clip", state_norm_clip},
            {"seed", seed},
        };
    }

    // ======================================================
    // OffPolicyAgent 実装
    // ======================================================
    OffPolicyAgent::OffPolicyAgent(const Param& param, std::unique_ptr<Learner> learner,
        std::vector<int64_t> state_shape, const ActionSpaceInfo& action,
        torch::Device device, MetricsLogger* logger)
        : param_(Validate(param)),
        learner_(std::move(learner)),
        state_shape_(std::move(state_shape)),
        action_(action),
        device_(device),
        logger_(logger),
        memory_(MemoryOptions(param_, state_shape_, action_)),
        epsilon_(EpsilonOptions(param_)),
        bootstrap_discount_(std::pow(param_.discount_factor, static_cast<float>(param_.n_step))),
        rng_(static_cast<uint64_t>(param_.seed))
    {
        if (!learner_)
            throw std::invalid_argument("OffPolicyAgent: learner is null");
        if (action_.n < 1)
            throw std::invalid_argument("OffPolicyAgent: action space is empty");
        if (!action_.discrete && !(action_.low < action_.high)) {
            throw std::invalid_argument("OffPolicyAgent: action limit must satisfy low < high, got (" +
                std::to_string(action_.low) + ", " + std::to_string(action_.high) + ")");
        }

        if (param_.n_step > 1)
            rollout_.emplace(param_.n_step, param_.discount_factor);

        // ターゲット同期（polyak_factor > 0 なら soft）
        const auto sync_options = TargetUpdateOptions::FromConfig(param_.polyak_factor, param_.target_update_frequency);
        for (auto& pair : learner_->TargetPairs()) {
            synchronizers_.emplace_back(pair.live, pair.target, sync_options, pair.name);
        }

        if (!action_.discrete && !learner_->Stochastic()) {
            NoiseOptions o;
            o.dim = action_.n;
            o.mean = param_.noise_mean;
            o.sigma = param_.noise_sigma;
            o.sigma_min = param_.noise_sigma_min;
            o.n_step_annealing = param_.noise_annealing_steps;
            o.theta = param_.noise_theta;
            o.dt = param_.noise_dt;
            o.seed = static_cast<uint64_t>(param_.seed);
            noise_ = MakeNoise(param_.noise_type, o);
        }

        if (param_.state_normalization)
            normalizer_ = std::make_unique<RunningNormalizer>(state_shape_, param_.state_norm_clip);

        // ログ：パラメータ記録
        wxLogInfo("agent=%s n_step=%d bootstrap_discount=%.6f target_update=%s",
            ToString(learner_->Type()), param_.n_step, bootstrap_discount_,
            param_.polyak_factor > 0.0f ? "soft" : "hard");
        if (logger_) {
            nlohmann::json params = param_.ToJson();
            params["agent_type"] = ToString(learner_->Type());
            logger_->LogJson("agent/params", params);
            logger_->Flush();
        }
    }

    // ======================================================
    // Act：行動選択（ε-greedy / 加法ノイズ / 方策サンプル）
    // ======================================================
    torch::Tensor OffPolicyAgent::Act(const torch::Tensor& state, bool explore) {
        auto s = normalizer_ ? normalizer_->Normalize(state.to(torch::kFloat)) : state;

        // 確率的方策は自分でサンプルする
        if (learner_->Stochastic())
            return learner_->SelectAction(s, explore);

        auto action = learner_->SelectAction(s, explore);
        if (!explore) return action;

        if (action_.discrete) {
            const float eps = epsilon_.Value();
            epsilon_.Step();
            std::uniform_real_distribution<float> unit(0.0f, 1.0f);
            if (unit(rng_) < eps) {
                // 確率εがヒットした場合はランダムでActionを決定
                std::uniform_int_distribution<int64_t> pick(0, action_.n - 1);
                action = torch::tensor({ pick(rng_) }, torch::kLong);
            }
            return action;
        }

        return (action + noise_->Sample()).clamp(action_.low, action_.high);
    }

    // ======================================================
    // Observe：経験の保存
    // ======================================================
    void OffPolicyAgent::Observe(const Experience& e) {
        const float reward = e.response.reward * param_.reward_scaling;
        const bool terminal = e.Absorbing();   // 打ち切りはブートストラップを続ける

        if (normalizer_) normalizer_->Update(e.state);

        if (rollout_) {
            rollout_->Push(e.state, e.action, reward);
            if (auto t = rollout_->GetTransition(e.response.next_state, terminal)) {
                memory_.Push(*t);
            }
        } else {
            memory_.Push(e.state, e.action, reward, e.response.next_state, terminal);
        }

        if (e.EpisodeEnd()) {
            if (rollout_) rollout_->Reset();
            if (noise_) noise_->Reset();
        }

        env_steps_++;

        // WarmingUp → Training（一方向）
        const int64_t needed = memory_.Combined() ? 2 : 1;
        if (phase_ == AgentPhase::WarmingUp &&
            memory_.Size() > param_.warm_up_steps && memory_.Size() >= needed) {
            phase_ = AgentPhase::Training;
            wxLogMessage("agent: warm-up finished at env step %lld (memory=%lld)",
                static_cast<long long>(env_steps_), static_cast<long long>(memory_.Size()));
            LogScalar("30_agent/01_phase", 1.0);
        }
    }

    // ======================================================
    // Update：1回の学習ステップ
    // ======================================================
    bool OffPolicyAgent::Update() {
        if (phase_ != AgentPhase::Training) return false;
        updates_++;

        auto batch = memory_.Sample(param_.batch_size, device_);
        if (normalizer_) {
            batch.state = normalizer_->Normalize(batch.state);
            batch.next_state = normalizer_->Normalize(batch.next_state);
        }

        auto target = learner_->ComputeTarget(batch, bootstrap_discount_).detach();
        for (const auto& term : learner_->CriticLosses(batch, target)) {
            ApplyLoss(term);
        }

        // Actor とターゲット同期は policy_update_frequency 回に1回
        if (updates_ % param_.policy_update_frequency == 0) {
            if (learner_->HasActor()) {
                for (const auto& term : learner_->ActorLosses(batch)) {
                    ApplyLoss(term);
                }
                learner_->OnActorStepped();
            }
            for (auto& sync : synchronizers_) {
                sync.Step();
            }
            policy_updates_++;
        }

        if (action_.discrete) LogScalar("30_agent/02_epsilon", epsilon_.Value());
        else if (noise_) LogScalar("30_agent/03_noise_sigma", noise_->Sigma());
        return true;
    }

    float OffPolicyAgent::ApplyLoss(const LossTerm& term) {
        TORCH_CHECK(term.optimizer != nullptr, "LossTerm '", term.tag, "' has no optimizer");
        TORCH_CHECK(term.loss.defined() && term.loss.numel() == 1, "LossTerm '", term.tag, "' must be a scalar");

        term.optimizer->zero_grad();
        term.loss.backward();
        if (term.grad_clip > 0.0f) {
            const double norm = torch::nn::utils::clip_grad_norm_(term.params, term.grad_clip);
            LogScalar("21_agent_grad/" + term.tag + "_norm", norm);
        }
        term.optimizer->step();

        const float loss = util::itemf(term.loss);
        auto it = loss_ema_.find(term.tag);
        if (it == loss_ema_.end())
            it = loss_ema_.emplace(term.tag, EmaFilter<float>(met_ema_decay)).first;
        it->second.Update(loss);
        LogScalar("20_agent_loss/" + term.tag, loss);
        LogScalar("20_agent_loss/" + term.tag + "_ema", it->second.Value());
        return loss;
    }

    int OffPolicyAgent::Step(const Experience& experience) {
        Observe(experience);
        if (phase_ != AgentPhase::Training || env_steps_ % param_.update_frequency != 0)
            return 0;
        int performed = 0;
        for (int i = 0; i < param_.update_steps; ++i) {
            if (Update()) performed++;
        }
        return performed;
    }

    void OffPolicyAgent::LogScalar(const std::string& tag, double value) {
        if (logger_) logger_->LogScalar(tag, env_steps_, value);
    }

    // ======================================================
    // チェックポイント
    // ======================================================
    std::filesystem::path OffPolicyAgent::Save(const CheckpointStore& store) {
        torch::serialize::OutputArchive archive;
        learner_->Save(archive);

        if (normalizer_) {
            torch::serialize::OutputArchive norm;
            normalizer_->Save(norm);
            archive.write("normalizer", norm);
        }

        torch::serialize::OutputArchive step;
        step.write("env_steps", torch::tensor(env_steps_, torch::kLong), /*is_buffer=*/true);
        step.write("updates", torch::tensor(updates_, torch::kLong), /*is_buffer=*/true);
        step.write("policy_updates", torch::tensor(policy_updates_, torch::kLong), /*is_buffer=*/true);
        step.write("epsilon_steps", torch::tensor(epsilon_.Steps(), torch::kLong), /*is_buffer=*/true);
        archive.write("step", step);

        auto path = store.Save(archive, env_steps_);
        wxLogMessage("agent: checkpoint saved to %s", path.string());
        return path;
    }

    bool OffPolicyAgent::Load(const CheckpointStore& store) {
        torch::serialize::InputArchive archive;
        if (!store.Load(archive)) return false;

        learner_->Load(archive);

        if (normalizer_) {
            torch::serialize::InputArchive norm;
            try {
                archive.read("normalizer", norm);
            }
            catch (const c10::Error& e) {
                const auto step = store.LatestStep();
                throw std::runtime_error("OffPolicyAgent: checkpoint " +
                    (step ? store.PathFor(*step).string() : std::string("(unknown)")) +
                    " has no normalizer statistics (state_normalization is on): " + e.what_without_backtrace());
            }
            normalizer_->Load(norm);
        }

        torch::serialize::InputArchive step;
        archive.read("step", step);
        torch::Tensor env_steps, updates, policy_updates, epsilon_steps;
        step.read("env_steps", env_steps, /*is_buffer=*/true);
        step.read("updates", updates, /*is_buffer=*/true);
        step.read("policy_updates", policy_updates, /*is_buffer=*/true);
        step.read("epsilon_steps", epsilon_steps, /*is_buffer=*/true);
        env_steps_ = env_steps.item<int64_t>();
        updates_ = updates.item<int64_t>();
        policy_updates_ = policy_updates.item<int64_t>();
        epsilon_.SetSteps(epsilon_steps.item<int64_t>());

        wxLogMessage("agent: checkpoint restored (env step %lld)", static_cast<long long>(env_steps_));
        return true;
    }

} // namespace offrl::rl
