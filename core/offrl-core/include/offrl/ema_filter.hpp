#pragma once
#include <type_traits>

namespace offrl {

    /**
     * @brief 損失などの指数移動平均（メトリクス表示用）。
     *
     * value ← value + decay * (x - value)。最初の Update はその値で初期化する。
     */
    template <typename T>
    class EmaFilter {
        static_assert(std::is_arithmetic<T>::value, "EmaFilter<T> requires arithmetic type T.");

    public:
        explicit EmaFilter(T decay = T(0.01)) : decay_(decay) {}

        void Update(T x) {
            if (count_++ == 0) value_ = x;
            else value_ += decay_ * (x - value_);
        }

        T Value() const { return value_; }
        long long Count() const { return count_; }

    private:
        T decay_;
        T value_{};
        long long count_ = 0;
    };

} // namespace offrl
