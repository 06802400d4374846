#include "tools/ResultNormalizer.h"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ResultNormalizer {

namespace {
const char* kArrayKey = "__ndarray__";

bool isArrayEnvelope(const nlohmann::json& value) {
    return value.is_object() && value.contains(kArrayKey) && value[kArrayKey].is_array();
}
}

nlohmann::json normalize(const nlohmann::json& value) {
    if (isArrayEnvelope(value)) {
        return normalize(value[kArrayKey]);
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = normalize(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(normalize(item));
        }
        return out;
    }
    if (value.is_number_float() && !std::isfinite(value.get<double>())) {
        return nullptr;
    }
    return value;
}

nlohmann::json toSeries(const nlohmann::json& values) {
    if (isArrayEnvelope(values)) {
        return normalize(values[kArrayKey]);
    }
    if (values.is_array()) {
        return normalize(values);
    }
    if (values.is_null()) {
        return nlohmann::json::array();
    }
    return nlohmann::json::array({normalize(values)});
}

nlohmann::json normalizeMarketData(const MarketDataFrame& frame) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [code, fields] : frame) {
        nlohmann::json codeResult = nlohmann::json::object();
        for (const auto& [field, values] : fields) {
            codeResult[field] = toSeries(values);
        }
        result[code] = codeResult;
    }
    return result;
}

nlohmann::json normalizeInstrumentDetail(const nlohmann::json& detail) {
    nlohmann::json result = nlohmann::json::object();
    if (!detail.is_object()) return result;

    for (auto it = detail.begin(); it != detail.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string() || value.is_number() || value.is_boolean() || value.is_null()) {
            result[it.key()] = normalize(value);
        } else {
            result[it.key()] = value.dump();
        }
    }
    return result;
}

std::string formatTradingDate(const DateLike& date) {
    if (const auto* num = std::get_if<long long>(&date)) {
        std::string s = std::to_string(*num);
        if (s.size() == 8) {
            return s.substr(0, 4) + "-" + s.substr(4, 2) + "-" + s.substr(6, 2);
        }
        return s;
    }
    if (const auto* tp = std::get_if<std::chrono::system_clock::time_point>(&date)) {
        std::time_t t = std::chrono::system_clock::to_time_t(*tp);
        std::tm tmUtc{};
#ifdef _WIN32
        gmtime_s(&tmUtc, &t);
#else
        gmtime_r(&t, &tmUtc);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tmUtc, "%Y-%m-%d");
        return ss.str();
    }
    return std::get<std::string>(date);
}

nlohmann::json toTextContent(const nlohmann::json& payload) {
    return nlohmann::json::array({
        {{"type", "text"}, {"text", normalize(payload).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)}}
    });
}

nlohmann::json toPlainTextContent(const std::string& text) {
    return nlohmann::json::array({
        {{"type", "text"}, {"text", text}}
    });
}

} // namespace ResultNormalizer
