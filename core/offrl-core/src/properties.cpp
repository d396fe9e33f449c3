#include "offrl/properties.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace offrl {

    namespace {

        std::string Trim(const std::string& s) {
            const char* ws = " \t\r\n";
            size_t b = s.find_first_not_of(ws);
            if (b == std::string::npos) return "";
            size_t e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        [[noreturn]] void ThrowBadValue(const std::string& key, const std::string& value, const char* type) {
            throw std::invalid_argument("Properties: " + key + "=" + value + " is not a valid " + type);
        }

        // std::stoX は末尾ゴミを許すので、全体を消費したかを確認する
        template <typename T, typename F>
        T ParseWhole(const std::string& key, const std::string& v, const char* type, F parse) {
            size_t pos = 0;
            T result{};
            try {
                result = parse(v, &pos);
            }
            catch (const std::invalid_argument&) {
                ThrowBadValue(key, v, type);
            }
            catch (const std::out_of_range&) {
                ThrowBadValue(key, v, type);
            }
            if (pos != v.size()) ThrowBadValue(key, v, type);
            return result;
        }

    } // namespace

    Properties::Properties(const std::string& filename) {
        std::ifstream ifs(filename);
        if (!ifs) throw std::runtime_error("Properties: Cannot open: " + filename);
        Load(ifs);
    }

    Properties Properties::FromString(const std::string& text) {
        Properties props;
        std::istringstream iss(text);
        props.Load(iss);
        return props;
    }

    std::string Properties::Join(const std::string& group, const char* field) {
        if (group.empty()) return field;
        if (group.back() == '.') return group + field;
        return group + "." + field;
    }

    void Properties::Set(const std::string& key, const std::string& value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = value;
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, value);
    }

    const std::string* Properties::Find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    std::vector<std::string> Properties::Keys() const {
        std::vector<std::string> keys;
        keys.reserve(entries_.size());
        for (const auto& e : entries_) keys.push_back(e.first);
        return keys;
    }

    std::string Properties::Get(const std::string& key, const std::string& defaultValue) const {
        auto* v = Find(key);
        return v ? *v : defaultValue;
    }

    void Properties::Read(const std::string& key, std::string& value, const std::string& defaultValue) const {
        auto* v = Find(key);
        value = v ? *v : defaultValue;
    }

    void Properties::Read(const std::string& key, int& value, int defaultValue) const {
        auto* v = Find(key);
        if (!v) { value = defaultValue; return; }
        value = ParseWhole<int>(key, *v, "int",
            [](const std::string& s, size_t* pos) { return std::stoi(s, pos); });
    }

    void Properties::Read(const std::string& key, int64_t& value, int64_t defaultValue) const {
        auto* v = Find(key);
        if (!v) { value = defaultValue; return; }
        value = ParseWhole<int64_t>(key, *v, "int64",
            [](const std::string& s, size_t* pos) { return static_cast<int64_t>(std::stoll(s, pos)); });
    }

    void Properties::Read(const std::string& key, float& value, float defaultValue) const {
        auto* v = Find(key);
        if (!v) { value = defaultValue; return; }
        value = ParseWhole<float>(key, *v, "float",
            [](const std::string& s, size_t* pos) { return std::stof(s, pos); });
    }

    void Properties::Read(const std::string& key, double& value, double defaultValue) const {
        auto* v = Find(key);
        if (!v) { value = defaultValue; return; }
        value = ParseWhole<double>(key, *v, "double",
            [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
    }

    void Properties::Read(const std::string& key, bool& value, bool defaultValue) const {
        auto* p = Find(key);
        if (!p) { value = defaultValue; return; }
        const auto& v = *p;
        if (v == "true" || v == "TRUE" || v == "1" || v == "yes" || v == "on") { value = true; return; }
        if (v == "false" || v == "FALSE" || v == "0" || v == "no" || v == "off") { value = false; return; }
        ThrowBadValue(key, v, "bool");
    }

    void Properties::Load(std::istream& is) {
        std::string line;
        while (std::getline(is, line)) {
            if (line.empty() || line[0] == '#') continue; // コメント行スキップ

            size_t posHash = line.find('#');   // '#' 以降はコメント扱い
            if (posHash != std::string::npos)
                line = line.substr(0, posHash);

            size_t posSlash = line.find("//");  // '//' 以降はコメント扱い
            if (posSlash != std::string::npos)
                line = line.substr(0, posSlash);

            line = Trim(line);
            if (line.empty()) continue;

            size_t pos = line.find('=');    // '=' または ':' で区切る
            if (pos == std::string::npos)
                pos = line.find(':');
            if (pos == std::string::npos)
                continue;

            std::string key = Trim(line.substr(0, pos));
            std::string value = Trim(line.substr(pos + 1));

            // 末尾 ';' を除去
            while (!value.empty() && value.back() == ';')
                value.pop_back();
            value = Trim(value);

            if (!key.empty())
                Set(key, value);
        }
    }

} // namespace offrl
