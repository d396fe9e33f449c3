#include "offrl/networks.hpp"
#include <sstream>
#include <stdexcept>

namespace offrl::rl {

    std::vector<int64_t> ParseHiddenDims(const std::string& text) {
        std::vector<int64_t> dims;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            const auto b = item.find_first_not_of(" \t");
            if (b == std::string::npos) continue;
            const auto e = item.find_last_not_of(" \t");
            const auto token = item.substr(b, e - b + 1);
            size_t pos = 0;
            int64_t dim = 0;
            try {
                dim = std::stoll(token, &pos);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("ParseHiddenDims: not an integer '" + token + "'");
            }
            if (pos != token.size() || dim < 1)
                throw std::invalid_argument("ParseHiddenDims: invalid layer size '" + token + "'");
            dims.push_back(dim);
        }
        return dims;
    }

    // ======================================================
    // Mlp
    // ======================================================
    MlpImpl::MlpImpl(int64_t in_dim, const std::vector<int64_t>& hidden)
        : out_dim(in_dim)
    {
        layers = register_module("layers", torch::nn::ModuleList());
        for (auto h : hidden) {
            layers->push_back(torch::nn::Linear(out_dim, h));
            out_dim = h;
        }
    }

    torch::Tensor MlpImpl::forward(torch::Tensor x) {
        for (const auto& layer : *layers) {
            x = torch::relu(layer->as<torch::nn::Linear>()->forward(x));
        }
        return x;
    }

    // ======================================================
    // QNet
    // ======================================================
    QNetImpl::QNetImpl(int64_t state_dim, int64_t n_actions, const std::vector<int64_t>& hidden, bool dueling)
        : n_actions(n_actions), dueling(dueling)
    {
        body = register_module("body", Mlp(state_dim, hidden));
        advantage = register_module("advantage", torch::nn::Linear(body->out_dim, n_actions));
        if (dueling)
            value = register_module("value", torch::nn::Linear(body->out_dim, 1));
    }

    torch::Tensor QNetImpl::forward(torch::Tensor x) {
        auto h = body->forward(x);
        auto adv = advantage->forward(h);                           // (B, A)
        if (!dueling) return adv;
        return value->forward(h) + adv - adv.mean(1, /*keepdim=*/true);
    }

    // ======================================================
    // CategoricalQNet
    // ======================================================
    CategoricalQNetImpl::CategoricalQNetImpl(int64_t state_dim, int64_t n_actions, int64_t atoms,
        const std::vector<int64_t>& hidden, bool dueling)
        : n_actions(n_actions), atoms(atoms), dueling(dueling)
    {
        body = register_module("body", Mlp(state_dim, hidden));
        advantage = register_module("advantage", torch::nn::Linear(body->out_dim, n_actions * atoms));
        if (dueling)
            value = register_module("value", torch::nn::Linear(body->out_dim, atoms));
    }

    torch::Tensor CategoricalQNetImpl::forward(torch::Tensor x) {
        auto h = body->forward(x);
        auto adv = advantage->forward(h).view({ -1, n_actions, atoms });     // (B, A, atoms)
        if (!dueling) return adv;
        auto v = value->forward(h).view({ -1, 1, atoms });
        return v + adv - adv.mean(1, /*keepdim=*/true);
    }

    torch::Tensor CategoricalQNetImpl::Probabilities(torch::Tensor x) {
        return torch::softmax(forward(x), -1);
    }

    // ======================================================
    // QuantileQNet
    // ======================================================
    QuantileQNetImpl::QuantileQNetImpl(int64_t state_dim, int64_t n_actions, int64_t quantiles,
        const std::vector<int64_t>& hidden)
        : n_actions(n_actions), quantiles(quantiles)
    {
        body = register_module("body", Mlp(state_dim, hidden));
        head = register_module("head", torch::nn::Linear(body->out_dim, n_actions * quantiles));
    }

    torch::Tensor QuantileQNetImpl::forward(torch::Tensor x) {
        return head->forward(body->forward(x)).view({ -1, n_actions, quantiles });
    }

    // ======================================================
    // DeterministicActor
    // ======================================================
    DeterministicActorImpl::DeterministicActorImpl(int64_t state_dim, int64_t action_dim,
        const std::vector<int64_t>& hidden, float low, float high)
        : low(low), high(high)
    {
        body = register_module("body", Mlp(state_dim, hidden));
        head = register_module("head", torch::nn::Linear(body->out_dim, action_dim));
        // 出力層は小さく初期化
        torch::NoGradGuard no_grad;
        head->weight.uniform_(-3e-3, 3e-3);
        head->bias.uniform_(-3e-3, 3e-3);
    }

    torch::Tensor DeterministicActorImpl::forward(torch::Tensor state) {
        auto a = torch::tanh(head->forward(body->forward(state)));
        return low + (a + 1.0f) * 0.5f * (high - low);
    }

    // ======================================================
    // Critic / DoubleCritic
    // ======================================================
    CriticImpl::CriticImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden, int64_t output_dim)
        : output_dim(output_dim)
    {
        body = register_module("body", Mlp(state_dim + action_dim, hidden));
        head = register_module("head", torch::nn::Linear(body->out_dim, output_dim));
        torch::NoGradGuard no_grad;
        head->weight.uniform_(-3e-3, 3e-3);
        head->bias.uniform_(-3e-3, 3e-3);
    }

    torch::Tensor CriticImpl::forward(torch::Tensor state, torch::Tensor action) {
        return head->forward(body->forward(torch::cat({ state, action }, 1)));
    }

    DoubleCriticImpl::DoubleCriticImpl(int64_t state_dim, int64_t action_dim, const std::vector<int64_t>& hidden) {
        q1 = register_module("q1", Critic(state_dim, action_dim, hidden));
        q2 = register_module("q2", Critic(state_dim, action_dim, hidden));
    }

    std::pair<torch::Tensor, torch::Tensor> DoubleCriticImpl::forward(torch::Tensor state, torch::Tensor action) {
        return { q1->forward(state, action), q2->forward(state, action) };
    }

    // ======================================================
    // GaussianActor
    // ======================================================
    GaussianActorImpl::GaussianActorImpl(int64_t state_dim, int64_t action_dim,
        const std::vector<int64_t>& hidden, float low, float high)
        : low(low), high(high)
    {
        body = register_module("body", Mlp(state_dim, hidden));
        mean = register_module("mean", torch::nn::Linear(body->out_dim, action_dim));
        log_std = register_module("log_std", torch::nn::Linear(body->out_dim, action_dim));
        torch::NoGradGuard no_grad;
        for (auto* l : { &mean, &log_std }) {
            (*l)->weight.uniform_(-3e-3, 3e-3);
            (*l)->bias.uniform_(-3e-3, 3e-3);
        }
    }

    std::pair<torch::Tensor, torch::Tensor> GaussianActorImpl::forward(torch::Tensor state) {
        auto h = body->forward(state);
        return { mean->forward(h), log_std->forward(h).clamp(kLogStdMin, kLogStdMax) };
    }

    std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> GaussianActorImpl::Sample(torch::Tensor state, bool deterministic) {
        auto [mu, ls] = forward(state);
        auto sigma = ls.exp();
        const float scale = 0.5f * (high - low);
        const float bias = 0.5f * (high + low);

        auto raw = deterministic ? mu : mu + sigma * torch::randn_like(mu);
        auto squashed = torch::tanh(raw);

        // 対角ガウスの log 密度 + tanh / スケールのヤコビアン補正
        constexpr float kLogSqrt2Pi = 0.91893853f;   // log √(2π)
        auto log_prob = (-0.5f * ((raw - mu) / sigma).pow(2) - ls - kLogSqrt2Pi).sum(-1, /*keepdim=*/true);
        log_prob = log_prob - torch::log(scale * (1.0f - squashed.pow(2)) + 1e-6f).sum(-1, /*keepdim=*/true);

        auto action = squashed * scale + bias;
        auto mean_action = torch::tanh(mu) * scale + bias;
        return { action, log_prob, mean_action };
    }

} // namespace offrl::rl
