#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>

namespace offrl::rl {

    // =============================================================
    // 列挙・構造体（RunModeは学習/推論の切替）
    // =============================================================

    enum class RunMode { Train, Eval };
    inline bool IsTrain(RunMode mode) { return mode == RunMode::Train; }

    /**
     * @brief 環境が返すステップ応答。
     * next_state, reward, done, truncated の基本情報を保持。
     * truncated は時間切れによる打ち切り（終端状態ではない）。
     */
    struct EnvResponse {
        torch::Tensor next_state;
        float reward;
        bool done;
        bool truncated;
    };

    /**
     * @brief 環境から見た「1回の経験」。
     * 状態・行動と、その結果としてのEnvResponseを内包。
     */
    struct Experience {
        torch::Tensor state;
        torch::Tensor action;
        EnvResponse response;

        // エピソード境界（終端 or 打ち切り）
        bool EpisodeEnd() const { return response.done || response.truncated; }
        // 吸収状態か（打ち切りはブートストラップを続ける）
        bool Absorbing() const { return response.done && !response.truncated; }
    };

    /**
     * @brief ReplayMemory に格納する遷移。mask = 1 - terminal（0 か 1 のみ）。
     */
    struct Transition {
        torch::Tensor state;
        torch::Tensor action;
        float reward = 0.0f;
        torch::Tensor next_state;
        float mask = 1.0f;
    };

    /**
     * @brief サンプリング結果（各フィールドは (B, *field_shape) のコピー）。
     */
    struct Batch {
        torch::Tensor state;        // (B, *state_shape)
        torch::Tensor action;       // (B, *action_shape)
        torch::Tensor reward;       // (B, 1)
        torch::Tensor next_state;   // (B, *state_shape)
        torch::Tensor mask;         // (B, 1)
        torch::Tensor indices;      // (B,) 論理インデックス

        int64_t Size() const { return state.defined() ? state.size(0) : 0; }
    };

    // =============================================================
    // Environment 抽象クラス（Gym風API）
    // =============================================================

    struct StateSpaceInfo {
        torch::Tensor shape;
        torch::Tensor low;
        torch::Tensor high;
    };

    struct ActionSpaceInfo {
        bool discrete = true;
        int64_t n = 0;          // 離散: 行動数 / 連続: 次元数
        float low = -1.0f;      // 連続のみ
        float high = 1.0f;      // 連続のみ
    };

    class Environment {
    public:
        virtual StateSpaceInfo GetStateSpaceInfo() const = 0;
        virtual ActionSpaceInfo GetActionSpaceInfo() const = 0;

        virtual torch::Tensor Reset(RunMode mode = RunMode::Train) = 0;
        virtual EnvResponse DoStep(const torch::Tensor& action, RunMode mode = RunMode::Train) = 0;
        virtual torch::Tensor GetState() const = 0;

        virtual ~Environment() = default;
    };

} // namespace offrl::rl
