#include <torch/torch.h>
#include <wx/init.h>
#include <wx/cmdline.h>
#include <wx/log.h>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "offrl/agent.hpp"
#include "offrl/learner.hpp"
#include "offrl/metrics_logger.hpp"
#include "offrl/properties.hpp"
#include "offrl/tensor_utils.hpp"
#include "CartPoleEnv.hpp"
#include "PendulumEnv.hpp"
#include "Trainer.hpp"

static const wxCmdLineEntryDesc desc[] = {
    // kind,              short-name, long-name, usage,                    type,                  flags
    { wxCMD_LINE_SWITCH, "h",         "help",    "使い方を表示",            wxCMD_LINE_VAL_NONE,   wxCMD_LINE_OPTION_HELP },
    { wxCMD_LINE_SWITCH, "v",         "verbose", "ログを饒舌に" },
    { wxCMD_LINE_OPTION, "c",         "config",  "設定ファイルのパス",      wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_OPTION, "a",         "agent",   "agent.presetの上書き値",  wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_OPTION, "t",         "train",   "train.presetの上書き値",  wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_OPTION, "s",         "steps",   "総環境ステップ数",        wxCMD_LINE_VAL_NUMBER, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_OPTION, NULL,        "seed",    "乱数シード",              wxCMD_LINE_VAL_NUMBER, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_OPTION, "d",         "device",  "cpu / cuda",              wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL },
    { wxCMD_LINE_USAGE_TEXT, NULL,    NULL,      "offrl-train --config=offrl.txt --agent=cartpole_c51_dqn" },
    { wxCMD_LINE_NONE } // 終了マーク
};

namespace {

    // コマンドライン指定があれば preset を上書きして props にも書き戻す
    std::string ResolvePreset(offrl::Properties& props, const wxCmdLineParser& cmd_line,
        const char* short_name, const std::string& key, const std::string& fallback)
    {
        std::string preset = props.Get(key, fallback);
        wxString preset_override;
        if (cmd_line.Found(short_name, &preset_override)) {
            preset = preset_override.ToStdString();
            props.Set(key, preset);
        }
        wxLogInfo("%s=%s", key, preset);
        return preset;
    }

    std::unique_ptr<offrl::rl::Environment> MakeEnvironment(const std::string& name, uint64_t seed, int max_steps) {
        if (name == "cartpole") return std::make_unique<CartPoleEnv>(seed, max_steps);
        if (name == "pendulum") return std::make_unique<PendulumEnv>(seed, max_steps);
        throw std::invalid_argument("unknown env '" + name + "'");
    }

    int Run(const wxCmdLineParser& cmd_line) {
        wxString config = "offrl.txt";
        cmd_line.Found("c", &config);
        offrl::Properties props(config.ToStdString());

        // ログレベル
        int log_level = wxLOG_Message;
        props.Read("log.level", log_level, wxLOG_Message);
        if (cmd_line.Found("v")) log_level = wxLOG_Info;
        wxLog::SetLogLevel(static_cast<wxLogLevel>(log_level));

        const auto agent_preset = ResolvePreset(props, cmd_line, "a", "agent.preset", "agent");
        const auto train_preset = ResolvePreset(props, cmd_line, "t", "train.preset", "train");

        offrl::rl::OffPolicyAgent::Param agent_param(&props, agent_preset);
        offrl::rl::LearnerParam learner_param(&props, agent_preset);
        Trainer::Param train_param(&props, train_preset);

        long value = 0;
        if (cmd_line.Found("s", &value)) train_param.max_steps = value;
        if (cmd_line.Found("seed", &value)) {
            agent_param.seed = value;
            learner_param.seed = value;
        }
        torch::manual_seed(static_cast<uint64_t>(agent_param.seed));

        wxString device_name = props.Get("train.device", "cpu");
        cmd_line.Found("d", &device_name);
        torch::Device device(device_name.ToStdString());
        if (device.is_cuda() && !torch::cuda::is_available()) {
            wxLogWarning("CUDA is not available, falling back to CPU");
            device = torch::Device(torch::kCPU);
        }

        std::string log_root = props.Get("log.root", "logs");
        offrl::MetricsLogger logger(std::make_unique<offrl::JsonlSink>(), log_root);
        wxLogMessage("metrics: %s", logger.OutDir().string());

        auto env = MakeEnvironment(train_param.env, static_cast<uint64_t>(agent_param.seed), train_param.max_episode_steps);
        const auto state_shape = env->GetStateSpaceInfo().shape.to(torch::kLong);
        std::vector<int64_t> shape(state_shape.data_ptr<int64_t>(), state_shape.data_ptr<int64_t>() + state_shape.numel());

        offrl::rl::LearnerSpaces spaces;
        spaces.state_dim = offrl::util::NumElements(shape);
        spaces.action = env->GetActionSpaceInfo();
        spaces.device = device;

        const auto type = offrl::rl::ParseAgentType(props.Get(agent_preset + ".agent_type", "categorical_dqn"));
        logger.LogJson("agent/learner_params", learner_param.ToJson());

        offrl::rl::OffPolicyAgent agent(agent_param, offrl::rl::MakeLearner(type, spaces, learner_param),
            shape, spaces.action, device, &logger);

        Trainer trainer(train_param, *env, agent, &logger);
        trainer.Run();

        wxLogMessage("Training finished at env step %lld", static_cast<long long>(agent.EnvSteps()));
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char** argv) {
    wxInitializer initializer(argc, argv);
    if (!initializer.IsOk()) {
        fprintf(stderr, "Failed to initialize wxWidgets.\n");
        return EXIT_FAILURE;
    }

    wxCmdLineParser cmd_line(desc, argc, argv);
    const int parsed = cmd_line.Parse(true);
    if (parsed != 0) {
        return parsed < 0 ? EXIT_SUCCESS : EXIT_FAILURE;   // -1: --help
    }

    try {
        return Run(cmd_line);
    } catch (const std::exception& e) {
        wxLogError("offrl-train: %s", e.what());
        return EXIT_FAILURE;
    }
}
