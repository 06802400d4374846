#include "tools/ToolArguments.h"
#include <algorithm>
#include <cctype>

namespace ToolArguments {

bool isMissing(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key)) return true;
    const auto& v = args[key];
    if (v.is_null()) return true;
    if (v.is_string() && v.get<std::string>().empty()) return true;
    return false;
}

std::string findMissingRequired(const ToolSpec& spec, const nlohmann::json& args) {
    for (const auto& p : spec.parameters) {
        if (p.required && isMissing(args, p.key)) {
            return p.key;
        }
    }
    return "";
}

nlohmann::json applyDefaults(const ToolSpec& spec, const nlohmann::json& args) {
    nlohmann::json out = args.is_object() ? args : nlohmann::json::object();
    for (const auto& p : spec.parameters) {
        if (!p.defaultValue) continue;
        if (!out.contains(p.key) || out[p.key].is_null()) {
            out[p.key] = *p.defaultValue;
        }
    }
    return out;
}

std::string getString(const nlohmann::json& args, const std::string& key, const std::string& fallback) {
    if (!args.is_object() || !args.contains(key)) return fallback;
    const auto& v = args[key];
    if (v.is_null()) return fallback;
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : v) {
            parts.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return join(parts);
    }
    return v.dump();
}

bool getBool(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key)) return false;
    const auto& v = args[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "true";
    }
    return false;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::vector<std::string> splitCsv(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string token = trim(text.substr(start, comma - start));
        if (!token.empty()) out.push_back(token);
        start = comma + 1;
    }
    return out;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace ToolArguments
