#include "offrl/learner.hpp"
#include <stdexcept>
#include "learners/learners.hpp"

namespace offrl::rl {

    namespace {
        struct AgentTypeName {
            AgentType type;
            const char* name;
        };
        const AgentTypeName kAgentTypeNames[] = {
            { AgentType::DQN, "dqn" },
            { AgentType::DoubleDQN, "double_dqn" },
            { AgentType::CategoricalDQN, "categorical_dqn" },
            { AgentType::QuantileDQN, "quantile_dqn" },
            { AgentType::DDPG, "ddpg" },
            { AgentType::TD3, "td3" },
            { AgentType::SAC, "sac" },
            { AgentType::QuantileDDPG, "quantile_ddpg" },
        };
    } // namespace

    AgentType ParseAgentType(const std::string& name) {
        for (const auto& e : kAgentTypeNames) {
            if (name == e.name) return e.type;
        }
        throw std::invalid_argument("unknown agent type '" + name + "'");
    }

    std::string ToString(AgentType type) {
        for (const auto& e : kAgentTypeNames) {
            if (type == e.type) return e.name;
        }
        return "unknown";
    }

    bool IsDiscrete(AgentType type) {
        switch (type) {
        case AgentType::DQN:
        case AgentType::DoubleDQN:
        case AgentType::CategoricalDQN:
        case AgentType::QuantileDQN:
            return true;
        default:
            return false;
        }
    }

    LearnerParam::LearnerParam(const Properties* props, const std::string& preset) {
        if (props == nullptr) return;
        OFFRL_READ_PROPS(props, preset, hidden);
        OFFRL_READ_PROPS(props, preset, learning_rate);
        OFFRL_READ_PROPS(props, preset, actor_learning_rate);
        OFFRL_READ_PROPS(props, preset, alpha_learning_rate);
        OFFRL_READ_PROPS(props, preset, critic_grad_norm);
        OFFRL_READ_PROPS(props, preset, actor_grad_norm);
        OFFRL_READ_PROPS(props, preset, use_double_q);
        OFFRL_READ_PROPS(props, preset, use_dueling);
        OFFRL_READ_PROPS(props, preset, support_dim);
        OFFRL_READ_PROPS(props, preset, v_min);
        OFFRL_READ_PROPS(props, preset, v_max);
        OFFRL_READ_PROPS(props, preset, quantile_kappa);
        OFFRL_READ_PROPS(props, preset, critic_l2_reg);
        OFFRL_READ_PROPS(props, preset, target_noise_std);
        OFFRL_READ_PROPS(props, preset, target_noise_limit);
        OFFRL_READ_PROPS(props, preset, alpha_tuning);
        OFFRL_READ_PROPS(props, preset, alpha);
        OFFRL_READ_PROPS(props, preset, seed);
    }

    nlohmann::json LearnerParam::ToJson() const {
        return {
            {"hidden", hidden},
            {"learning_rate", learning_rate},
            {"actor_learning_rate", actor_learning_rate},
            {"alpha_learning_rate", alpha_learning_rate},
            {"critic_grad_norm", critic_grad_norm},
            {"actor_grad_norm", actor_grad_norm},
            {"use_double_q", use_double_q},
            {"use_dueling", use_dueling},
            {"support_dim", support_dim},
            {"v_min", v_min},
            {"v_max", v_max},
            {"quantile_kappa", quantile_kappa},
            {"critic_l2_reg", critic_l2_reg},
            {"target_noise_std", target_noise_std},
            {"target_noise_limit", target_noise_limit},
            {"alpha_tuning", alpha_tuning},
            {"alpha", alpha},
            {"seed", seed},
        };
    }

    void Learner::Save(torch::serialize::OutputArchive& archive) {
        torch::serialize::OutputArchive networks;
        for (auto& net : Networks()) {
            torch::serialize::OutputArchive sub;
            net.module->save(sub);
            networks.write(net.name, sub);
        }
        archive.write("networks", networks);
    }

    void Learner::Load(torch::serialize::InputArchive& archive) {
        torch::serialize::InputArchive networks;
        archive.read("networks", networks);
        for (auto& net : Networks()) {
            torch::serialize::InputArchive sub;
            networks.read(net.name, sub);
            net.module->load(sub);
        }
    }

    std::unique_ptr<Learner> MakeLearner(AgentType type, const LearnerSpaces& spaces, const LearnerParam& param) {
        if (spaces.state_dim < 1)
            throw std::invalid_argument("MakeLearner: state_dim must be >= 1, got " + std::to_string(spaces.state_dim));
        if (spaces.action.n < 1)
            throw std::invalid_argument("MakeLearner: action space is empty");
        if (IsDiscrete(type) != spaces.action.discrete) {
            throw std::invalid_argument("MakeLearner: agent '" + ToString(type) + "' does not support a " +
                (spaces.action.discrete ? "discrete" : "continuous") + " action space");
        }

        switch (type) {
        case AgentType::DQN:
            return std::make_unique<DqnLearner>(spaces, param, param.use_double_q);
        case AgentType::DoubleDQN:
            return std::make_unique<DqnLearner>(spaces, param, true);
        case AgentType::CategoricalDQN:
            return std::make_unique<CategoricalDqnLearner>(spaces, param);
        case AgentType::QuantileDQN:
            return std::make_unique<QuantileDqnLearner>(spaces, param);
        case AgentType::DDPG:
            return std::make_unique<DdpgLearner>(spaces, param, false);
        case AgentType::QuantileDDPG:
            return std::make_unique<DdpgLearner>(spaces, param, true);
        case AgentType::TD3:
            return std::make_unique<Td3Learner>(spaces, param);
        case AgentType::SAC:
            return std::make_unique<SacLearner>(spaces, param);
        }
        throw std::invalid_argument("MakeLearner: unsupported agent type");
    }

} // namespace offrl::rl
