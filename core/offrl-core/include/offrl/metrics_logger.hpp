#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace offrl {
    using json = nlohmann::json;

    //----------------------------------------------
    // 出力先インターフェース
    //----------------------------------------------
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;
        virtual void Open(const std::filesystem::path& run_dir) = 0;
        virtual void Write(const json& record) = 0;
        virtual void Flush() = 0;
    };

    //----------------------------------------------
    // JSONL 出力（<root>/<run>/metrics.jsonl に1行1レコード）
    //----------------------------------------------
    class JsonlSink : public MetricsSink {
    public:
        void Open(const std::filesystem::path& run_dir) override;
        void Write(const json& record) override;
        void Flush() override;

        const std::filesystem::path& Path() const { return path_; }

    private:
        std::filesystem::path path_;
        std::ofstream ofs_;
        std::mutex mutex_;
    };

    // 数値中の浮動小数を digits 桁に丸める（object / array は再帰）
    json RoundFloats(const json& j, int digits = 6);

    /**
     * @brief 学習メトリクスの記録。
     *
     * レコード種別:
     *  - meta   : {"type":"meta","event":"start"|"end","run","timestamp"}
     *  - scalar : {"type":"scalar","tag","step","value"}
     *  - json   : {"type":"json","tag","timestamp","data"}（data の浮動小数は6桁）
     *
     * run を省略すると "run_%Y%m%d-%H%M%S"。破棄時に end レコードを書く。
     */
    class MetricsLogger {
    public:
        explicit MetricsLogger(std::unique_ptr<MetricsSink> sink,
            const std::string& root = "logs",
            const std::string& run = "");
        ~MetricsLogger();

        MetricsLogger(const MetricsLogger&) = delete;
        MetricsLogger& operator=(const MetricsLogger&) = delete;

        void LogScalar(const std::string& tag, int64_t step, double value);
        void LogJson(const std::string& tag, const json& data);
        void Flush();

        const std::string& RunName() const { return run_name_; }
        std::filesystem::path OutDir() const { return root_dir_ / run_name_; }

    private:
        void WriteMeta(const char* event);

        std::unique_ptr<MetricsSink> sink_;
        std::filesystem::path root_dir_;
        std::string run_name_;
    };

} // namespace offrl
