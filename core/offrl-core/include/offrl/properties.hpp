#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// "<group>.<field>" を読み込み、同名のメンバ変数へ。キーが無ければ現在値を維持
#ifndef OFFRL_READ_PROPS
#define OFFRL_READ_PROPS(props, group, field) \
    (props)->Read(::offrl::Properties::Join(group, #field), (field), (field))
#endif

namespace offrl {

    /**
     * @brief "key = value" 形式の設定ファイル。
     *
     * - '#' と '//' 以降はコメント
     * - 区切りは '=' または ':'
     * - 値末尾の ';' は除去
     * - 同じキーは後勝ち（位置は最初の出現のまま）
     * - 値の型変換に失敗した場合は std::invalid_argument（キー名付き）
     */
    class Properties {
    public:
        Properties() = default;
        explicit Properties(const std::string& filename);

        // 文字列から読み込む（テスト・埋め込み設定用）
        static Properties FromString(const std::string& text);

        // group が空なら field のみ、'.' 終わりならそのまま連結
        static std::string Join(const std::string& group, const char* field);

        void Set(const std::string& key, const std::string& value);
        bool Has(const std::string& key) const { return index_.count(key) != 0; }
        // 記述順
        std::vector<std::string> Keys() const;

        std::string Get(const std::string& key, const std::string& defaultValue = "") const;

        void Read(const std::string& key, std::string& value, const std::string& defaultValue) const;
        void Read(const std::string& key, int& value, int defaultValue) const;
        void Read(const std::string& key, int64_t& value, int64_t defaultValue) const;
        void Read(const std::string& key, float& value, float defaultValue) const;
        void Read(const std::string& key, double& value, double defaultValue) const;
        void Read(const std::string& key, bool& value, bool defaultValue) const;

    private:
        const std::string* Find(const std::string& key) const;
        void Load(std::istream& is);

        std::vector<std::pair<std::string, std::string>> entries_;
        std::unordered_map<std::string, size_t> index_;
    };

} // namespace offrl
