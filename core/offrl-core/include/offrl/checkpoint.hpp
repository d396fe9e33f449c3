#pragma once
#include <torch/torch.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace offrl {

    /**
     * @brief <dir>/<prefix>_<step>.pt 形式のチェックポイント置き場。
     * 中身は torch::serialize のアーカイブ（名前付きサブアーカイブの集合）として扱い、解釈しない。
     */
    class CheckpointStore {
    public:
        explicit CheckpointStore(std::filesystem::path dir, std::string prefix = "checkpoint");

        // 保存先パスを返す。書けない場合は std::runtime_error
        std::filesystem::path Save(torch::serialize::OutputArchive& archive, int64_t step) const;

        // 最新のチェックポイントを読み込む。無ければ false
        bool Load(torch::serialize::InputArchive& archive) const;

        std::optional<int64_t> LatestStep() const;
        std::filesystem::path PathFor(int64_t step) const;
        const std::filesystem::path& Dir() const { return dir_; }

    private:
        std::filesystem::path dir_;
        std::string prefix_;
    };

} // namespace offrl
