#pragma once
#include <torch/torch.h>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace offrl::rl {

    // "128,128" → {128, 128}。空文字列は隠れ層なし
    std::vector<int64_t> ParseHiddenDims(const std::string& text);

    // ======================================================
    // MLP 本体（Linear + ReLU の積み重ね）
    // ======================================================
    struct MlpImpl : torch::nn::Module {
        torch::nn::ModuleList layers;
        int64_t out_dim;

        MlpImpl(int64_t in_dim, const std::vector<int64_t>& hidden);
        torch::Tensor forward(torch::Tensor x);
    };
    TORCH_MODULE(Mlp);

    // ======================================================
    // 離散行動の価値ネットワーク
    // ======================================================

    // Q(s, ·) → (B, A)。dueling なら V + A - mean(A)
    struct QNetImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear advantage{ nullptr };
        torch::nn::Linear value{ nullptr };
        int64_t n_actions;
        bool dueling;

        QNetImpl(int64_t state_dim, int64_t n_actions, const std::vector<int64_t>& hidden, bool dueling = false);
        torch::Tensor forward(torch::Tensor x);
    };
    TORCH_MODULE(QNet);

    // C51: 行動ごとの atoms 個のロジット → (B, A, atoms)
    struct CategoricalQNetImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear advantage{ nullptr };
        torch::nn::Linear value{ nullptr };
        int64_t n_actions;
        int64_t atoms;
        bool dueling;

        CategoricalQNetImpl(int64_t state_dim, int64_t n_actions, int64_t atoms,
            const std::vector<int64_t>& hidden, bool dueling = false);
        torch::Tensor forward(torch::Tensor x);            // ロジット
        torch::Tensor Probabilities(torch::Tensor x);      // softmax(dim=-1)
    };
    TORCH_MODULE(CategoricalQNet);

    // QR-DQN: 行動ごとの分位点 → (B, A, N)
    struct QuantileQNetImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear head{ nullptr };
        int64_t n_actions;
        int64_t quantiles;

        QuantileQNetImpl(int64_t state_dim, int64_t n_actions, int64_t quantiles, const std::vector<int64_t>& hidden);
        torch::Tensor forward(torch::Tensor x);
    };
    TORCH_MODULE(QuantileQNet);

    // ======================================================
    // 連続行動（Actor / Critic）
    // ======================================================

    // tanh 出力を [low, high] に写す決定論的方策
    struct DeterministicActorImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear head{ nullptr };
        float low;
        float high;

        DeterministicActorImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden,
            float low = -1.0f, float high = 1.0f);
        torch::Tensor forward(torch::Tensor state);
    };
    TORCH_MODULE(DeterministicActor);

    // Q(s, a) → (B, output_dim)。output_dim > 1 は分位点 Critic
    struct CriticImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear head{ nullptr };
        int64_t output_dim;

        CriticImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden, int64_t output_dim = 1);
        torch::Tensor forward(torch::Tensor state, torch::Tensor action);
    };
    TORCH_MODULE(Critic);

    // 独立な2本の Critic（TD3 / SAC）
    struct DoubleCriticImpl : torch::nn::Module {
        Critic q1{ nullptr };
        Critic q2{ nullptr };

        DoubleCriticImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden);
        std::pair<torch::Tensor, torch::Tensor> forward(torch::Tensor state, torch::Tensor action);

        std::vector<torch::Tensor> Q1Parameters() { return q1->parameters(); }
        std::vector<torch::Tensor> Q2Parameters() { return q2->parameters(); }
    };
    TORCH_MODULE(DoubleCritic);

    /**
     * @brief tanh で押し込んだガウス方策（SAC）。
     * log σ は [-20, 2] にクランプ。Sample は reparameterization で (action, log_prob, mean_action) を返す。
     * log_prob は tanh と [low, high] への線形写像のヤコビアンを補正済み、形状 (B, 1)。
     */
    struct GaussianActorImpl : torch::nn::Module {
        Mlp body{ nullptr };
        torch::nn::Linear mean{ nullptr };
        torch::nn::Linear log_std{ nullptr };
        float low;
        float high;

        static constexpr float kLogStdMin = -20.0f;
        static constexpr float kLogStdMax = 2.0f;

        GaussianActorImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden,
            float low = -1.0f, float high = 1.0f);

        std::pair<torch::Tensor, torch::Tensor> forward(torch::Tensor state);    // (mean, log_std)
        std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> Sample(torch::Tensor state, bool deterministic = false);
    };
    TORCH_MODULE(GaussianActor);

} // namespace offrl::rl
