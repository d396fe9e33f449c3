#include "Trainer.hpp"
#include <wx/log.h>

Trainer::Param::Param(const offrl::Properties* props, const std::string& preset) {
    if (props == nullptr) return;
    OFFRL_READ_PROPS(props, preset, env);
    OFFRL_READ_PROPS(props, preset, max_steps);
    OFFRL_READ_PROPS(props, preset, max_episode_steps);
    OFFRL_READ_PROPS(props, preset, eval_interval);
    OFFRL_READ_PROPS(props, preset, eval_episodes);
    OFFRL_READ_PROPS(props, preset, checkpoint_interval);
    OFFRL_READ_PROPS(props, preset, checkpoint_dir);
    OFFRL_READ_PROPS(props, preset, resume);
}

Trainer::Trainer(const Param& param, offrl::rl::Environment& env, offrl::rl::OffPolicyAgent& agent,
    offrl::MetricsLogger* logger)
    : param_(param), env_(env), agent_(agent), logger_(logger), store_(param.checkpoint_dir)
{
    // パラメータ記録
    if (logger_) {
        nlohmann::json params = {
            {"env", param_.env},
            {"max_steps", param_.max_steps},
            {"max_episode_steps", param_.max_episode_steps},
            {"eval_interval", param_.eval_interval},
            {"eval_episodes", param_.eval_episodes},
            {"checkpoint_interval", param_.checkpoint_interval},
            {"checkpoint_dir", param_.checkpoint_dir},
            {"resume", param_.resume},
        };
        logger_->LogJson("train/params", params);
        logger_->Flush();
    }
}

void Trainer::Run() {
    if (param_.resume && agent_.Load(store_)) {
        wxLogMessage("Resumed from env step %lld", static_cast<long long>(agent_.EnvSteps()));
    }

    int episode_count = 0;
    float train_total_reward = 0.0f;
    int64_t last_episode_step = agent_.EnvSteps();
    auto state = env_.Reset();

    while (agent_.EnvSteps() < param_.max_steps) {
        // 行動選択と環境ステップ実行、更新
        auto action = agent_.Act(state, /*explore=*/true);
        auto response = env_.DoStep(action);
        agent_.Step({ state, action, response });
        state = response.next_state.clone();
        train_total_reward += response.reward;

        if (param_.checkpoint_interval > 0 && agent_.EnvSteps() % param_.checkpoint_interval == 0) {
            agent_.Save(store_);
        }

        //エピソード終了判定
        if (!response.done && !response.truncated) continue;
        episode_count++;

        auto eps_step = agent_.EnvSteps() - last_episode_step;
        wxLogMessage("Episode finished. eps=%d step=%lld total_reward=%f eps_step=%lld",
            episode_count, static_cast<long long>(agent_.EnvSteps()), train_total_reward, static_cast<long long>(eps_step));
        if (logger_) logger_->LogScalar("10_episode/01_total_reward", episode_count, train_total_reward);

        // 学習状況評価
        if (param_.eval_interval > 0 && episode_count % param_.eval_interval == 0) {
            const float eval_reward = Evaluate();
            wxLogMessage("Evaluation: eps=%d reward=%f", episode_count, eval_reward);
            if (logger_) {
                logger_->LogScalar("10_episode/02_eval_reward", episode_count, eval_reward);
                logger_->LogScalar("11_eval/01_policy_reward", agent_.EnvSteps(), eval_reward);
            }
        }

        // 環境リセット
        state = env_.Reset();
        last_episode_step = agent_.EnvSteps();
        train_total_reward = 0.0f;
    }

    agent_.Save(store_);
    if (logger_) logger_->Flush();
}

float Trainer::Evaluate() {
    float sum = 0.0f;
    for (int i = 0; i < param_.eval_episodes; ++i) {
        auto state = env_.Reset(offrl::rl::RunMode::Eval);
        bool done = false;
        float total_reward = 0.0f;
        while (!done) {
            auto action = agent_.Act(state, /*explore=*/false);
            auto response = env_.DoStep(action, offrl::rl::RunMode::Eval);
            total_reward += response.reward;
            state = response.next_state.clone();
            done = response.done || response.truncated;
        }
        sum += total_reward;
    }
    return param_.eval_episodes > 0 ? sum / static_cast<float>(param_.eval_episodes) : 0.0f;
}
