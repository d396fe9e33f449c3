#pragma once
#include <torch/torch.h>
#include <string>
#include <sstream>
#include <vector>

namespace offrl::util {

    // Device と dtype を一元管理する軽量コンテキスト
    // RingBuffer / ReplayMemory の保存先はこれで個別に指定する（プロセス共通のフラグは持たない）
    struct TensorContext {
        torch::Device device;
        torch::Dtype float_dtype = torch::kFloat;

        explicit TensorContext(torch::Device dev = torch::kCPU) : device(dev) {}

        inline torch::TensorOptions FloatOpt() const {
            return torch::TensorOptions().dtype(float_dtype).device(device);
        }
    };

    // =========================
    // 転送／基本ユーティリティ
    // =========================

    inline float itemf(const at::Tensor& t) {
        auto s = t.detach().to(torch::kCPU);
        TORCH_CHECK(s.numel() == 1, "itemf expects scalar, got numel=", s.numel(), " shape=", s.sizes());
        return s.item<float>();
    }

    // 要素数（shape の積）
    inline int64_t NumElements(const std::vector<int64_t>& shape) {
        int64_t n = 1;
        for (auto d : shape) n *= d;
        return n;
    }

    // (capacity, *shape) のような先頭次元付き shape を作る
    inline std::vector<int64_t> PrependDim(int64_t lead, const std::vector<int64_t>& shape) {
        std::vector<int64_t> out;
        out.reserve(shape.size() + 1);
        out.push_back(lead);
        out.insert(out.end(), shape.begin(), shape.end());
        return out;
    }

    // デバッグ用：shape を "(2, 4)" 形式に
    inline std::string ShapeToString(const std::vector<int64_t>& shape) {
        std::ostringstream oss;
        oss << "(";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i) oss << ", ";
            oss << shape[i];
        }
        oss << ")";
        return oss.str();
    }

} // namespace offrl::util
