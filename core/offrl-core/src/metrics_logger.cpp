#include "offrl/metrics_logger.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <stdexcept>

namespace offrl {

    namespace {

        // ローカル時刻を strftime 書式で
        std::string FormatLocalTime(const char* format) {
            const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
#ifdef _WIN32
            localtime_s(&tm, &tt);
#else
            localtime_r(&tt, &tm);
#endif
            char buf[64];
            std::strftime(buf, sizeof(buf), format, &tm);
            return buf;
        }

        std::string Timestamp() { return FormatLocalTime("%Y-%m-%dT%H:%M:%S"); }

    } // namespace

    //----------------------------------------------
    // JsonlSink
    //----------------------------------------------
    void JsonlSink::Open(const std::filesystem::path& run_dir) {
        std::filesystem::create_directories(run_dir);
        path_ = run_dir / "metrics.jsonl";
        ofs_.open(path_, std::ios::app);
        if (!ofs_) throw std::runtime_error("JsonlSink: cannot open " + path_.string());
    }

    void JsonlSink::Write(const json& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        ofs_ << record.dump() << "\n";
    }

    void JsonlSink::Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        ofs_.flush();
    }

    json RoundFloats(const json& j, int digits) {
        if (j.is_number_float()) {
            const double scale = std::pow(10.0, digits);
            return std::round(j.get<double>() * scale) / scale;
        }
        if (j.is_object()) {
            json out = json::object();
            for (auto& [k, v] : j.items()) out[k] = RoundFloats(v, digits);
            return out;
        }
        if (j.is_array()) {
            json out = json::array();
            for (auto& v : j) out.push_back(RoundFloats(v, digits));
            return out;
        }
        return j;
    }

    //----------------------------------------------
    // MetricsLogger
    //----------------------------------------------
    MetricsLogger::MetricsLogger(std::unique_ptr<MetricsSink> sink, const std::string& root, const std::string& run)
        : sink_(std::move(sink)), root_dir_(root), run_name_(run.empty() ? FormatLocalTime("run_%Y%m%d-%H%M%S") : run)
    {
        if (!sink_) throw std::invalid_argument("MetricsLogger: sink is null");
        sink_->Open(OutDir());
        WriteMeta("start");
    }

    MetricsLogger::~MetricsLogger() {
        WriteMeta("end");
        sink_->Flush();
    }

    void MetricsLogger::WriteMeta(const char* event) {
        sink_->Write({ {"type", "meta"}, {"event", event}, {"run", run_name_}, {"timestamp", Timestamp()} });
    }

    void MetricsLogger::LogScalar(const std::string& tag, int64_t step, double value) {
        sink_->Write({ {"type", "scalar"}, {"tag", tag}, {"step", step}, {"value", value} });
    }

    void MetricsLogger::LogJson(const std::string& tag, const json& data) {
        sink_->Write({ {"type", "json"}, {"tag", tag}, {"timestamp", Timestamp()}, {"data", RoundFloats(data)} });
    }

    void MetricsLogger::Flush() {
        sink_->Flush();
    }

} // namespace offrl
