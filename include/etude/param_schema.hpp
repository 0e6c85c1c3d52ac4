#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace etude {

//---------------------------------------------------------
// Field descriptions for exercise parameter forms
//---------------------------------------------------------

enum class Kind { kInt, kBool, kEnum, kIntList, kString };

struct IntRange { int min, max, step; };
struct Choice   { std::string label; std::string value; };

using Value = std::variant<int, bool, std::string, std::vector<int>>;

struct Field {
    std::string key;
    std::string label;
    Kind kind;
    Value def;
    std::optional<IntRange> ir{};
    std::vector<Choice>     choices;
    bool optional = false;
    std::string help;
};

//---------------------------------------------------------
// Schema container; fields keep declaration order for forms
//---------------------------------------------------------
struct Schema {
    std::string id;
    int version = 1;
    std::vector<Field> fields;

    const Field* find(const std::string& key) const {
        for (const auto& f : fields) {
            if (f.key == key) return &f;
        }
        return nullptr;
    }

    nlohmann::json to_json() const {
        using nlohmann::json;
        auto kind_str = [](Kind k) {
            switch (k) {
                case Kind::kInt: return "int";
                case Kind::kBool: return "bool";
                case Kind::kEnum: return "enum";
                case Kind::kIntList: return "int_list";
                case Kind::kString: return "string";
            }
            return "unknown";
        };
        json jf = json::array();
        for (const auto& f : fields) {
            json j;
            j["key"]   = f.key;
            j["label"] = f.label;
            j["kind"]  = kind_str(f.kind);
            std::visit([&](const auto& v) { j["default"] = v; }, f.def);
            if (f.ir) {
                j["min"] = f.ir->min;
                j["max"] = f.ir->max;
                j["step"] = f.ir->step;
            }
            if (!f.choices.empty()) {
                json ch = json::array();
                for (const auto& c : f.choices)
                    ch.push_back({{"label", c.label}, {"value", c.value}});
                j["choices"] = ch;
            }
            if (f.optional) j["optional"] = true;
            if (!f.help.empty()) j["help"] = f.help;
            jf.push_back(std::move(j));
        }
        return json{{"id", id}, {"version", version}, {"fields", jf}};
    }
};

} // namespace etude
