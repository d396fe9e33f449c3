#include "offrl/checkpoint.hpp"
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace offrl {

    CheckpointStore::CheckpointStore(fs::path dir, std::string prefix)
        : dir_(std::move(dir)), prefix_(std::move(prefix))
    {
        if (prefix_.empty())
            throw std::invalid_argument("CheckpointStore: prefix is empty");
    }

    fs::path CheckpointStore::PathFor(int64_t step) const {
        return dir_ / (prefix_ + "_" + std::to_string(step) + ".pt");
    }

    fs::path CheckpointStore::Save(torch::serialize::OutputArchive& archive, int64_t step) const {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec)
            throw std::runtime_error("CheckpointStore: cannot create " + dir_.string() + ": " + ec.message());

        // 一時名で書いてから rename
        const auto path = PathFor(step);
        const auto tmp = fs::path(path.string() + ".tmp");
        archive.save_to(tmp.string());
        fs::rename(tmp, path, ec);
        if (ec)
            throw std::runtime_error("CheckpointStore: cannot write " + path.string() + ": " + ec.message());
        return path;
    }

    std::optional<int64_t> CheckpointStore::LatestStep() const {
        std::error_code ec;
        if (!fs::is_directory(dir_, ec)) return std::nullopt;

        std::optional<int64_t> latest;
        const std::string head = prefix_ + "_";
        fs::directory_iterator it(dir_, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec)) continue;
            const auto name = entry.path().filename().string();
            if (name.size() <= head.size() + 3 || name.compare(0, head.size(), head) != 0) continue;
            if (entry.path().extension() != ".pt") continue;

            // 数字のみ、かつ int64 に収まるものだけ採用
            const char* first = name.data() + head.size();
            const char* last = name.data() + name.size() - 3;
            if (first == last || *first == '-' || *first == '+') continue;
            int64_t step = 0;
            const auto [ptr, err] = std::from_chars(first, last, step);
            if (err != std::errc() || ptr != last) continue;
            if (!latest || step > *latest) latest = step;
        }
        if (ec)
            throw std::runtime_error("CheckpointStore: cannot list " + dir_.string() + ": " + ec.message());
        return latest;
    }

    bool CheckpointStore::Load(torch::serialize::InputArchive& archive) const {
        const auto step = LatestStep();
        if (!step) return false;
        archive.load_from(PathFor(*step).string());
        return true;
    }

} // namespace offrl
