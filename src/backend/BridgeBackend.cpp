#include "backend/BridgeBackend.h"
#include "utils/Logger.h"
#include <httplib.h>
#include <chrono>
#include <regex>
#include <stdexcept>
#include <thread>

namespace {

// 端口必须落在 1..65535
int parsePort(const std::string& text, const std::string& url) {
    int value = 0;
    try {
        value = std::stoi(text);
    } catch (const std::out_of_range&) {
        value = 0;
    }
    if (value < 1 || value > 65535) {
        throw std::runtime_error("Invalid bridge port in " + url + ": " + text);
    }
    return value;
}

} // namespace

BridgeBackend::BridgeBackend(const std::string& baseUrl, int connectTimeoutSec, int readTimeoutSec, int maxRetries)
    : baseUrl(baseUrl), connectTimeout(connectTimeoutSec), readTimeout(readTimeoutSec),
      maxRetries(maxRetries < 1 ? 1 : maxRetries) {
    parseBaseUrl(baseUrl);
}

void BridgeBackend::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"(http://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        host = match[1];
        port = match[2].matched ? parsePort(match[2], url) : 80;
        pathPrefix = match[3];
        while (!pathPrefix.empty() && pathPrefix.back() == '/') {
            pathPrefix.pop_back();
        }
    } else {
        // 没有 scheme 时按 host[:port] 处理
        std::regex hostRegex(R"(([^/:]+)(?::(\d+))?)");
        if (std::regex_match(url, match, hostRegex)) {
            host = match[1];
            port = match[2].matched ? parsePort(match[2], url) : 80;
        } else {
            host = url;
        }
        pathPrefix = "";
    }
}

bool BridgeBackend::probe() {
    std::string endpoint = pathPrefix + "/api/capabilities";
    try {
        httplib::Client cli(host, port);
        cli.set_connection_timeout(connectTimeout);
        cli.set_read_timeout(readTimeout);
        auto res = cli.Get(endpoint);
        if (!res || res->status != 200) {
            Logger::getInstance().warn("xtquant 桥接服务不可达: " + baseUrl +
                                       " (" + (res ? std::to_string(res->status) : httplib::to_string(res.error())) + ")");
            return false;
        }

        auto j = nlohmann::json::parse(res->body);
        capabilities.clear();
        for (const auto& name : j.value("methods", nlohmann::json::array())) {
            Capability c;
            if (name.is_string() && capabilityFromName(name.get<std::string>(), c)) {
                capabilities.insert(c);
            }
        }
        Logger::getInstance().info("xtquant 桥接服务已连接: " + baseUrl + ", 可选能力 " +
                                   std::to_string(capabilities.size()) + " 项");
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("探测 xtquant 桥接服务失败: ") + e.what());
        return false;
    }
}

nlohmann::json BridgeBackend::call(const std::string& method, const nlohmann::json& params) {
    std::string endpoint = pathPrefix + "/api/" + method;
    std::string bodyStr = params.dump();

    httplib::Result res;
    int retryCount = 0;

    while (retryCount < maxRetries) {
        httplib::Client cli(host, port);
        cli.set_connection_timeout(connectTimeout);
        cli.set_read_timeout(readTimeout);
        res = cli.Post(endpoint, bodyStr, "application/json");

        // 只有传输层失败才重试,业务错误直接返回
        if (res) break;

        retryCount++;
        if (retryCount < maxRetries) {
            Logger::getInstance().warn("调用 " + method + " 失败 (" + httplib::to_string(res.error()) +
                                       "), 重试 " + std::to_string(retryCount) + "/" + std::to_string(maxRetries));
            std::this_thread::sleep_for(std::chrono::milliseconds(200 * retryCount));
        }
    }

    if (!res) {
        throw BackendError("无法连接 xtquant 桥接服务 (" + method + "): " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw BackendError("xtquant 桥接服务返回 HTTP " + std::to_string(res->status) + " (" + method + ")");
    }

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw BackendError("xtquant 桥接服务应答无法解析 (" + method + "): " + e.what());
    }

    if (!reply.value("ok", false)) {
        throw BackendError(reply.value("error", std::string("xtquant 桥接服务调用失败: ") + method));
    }
    return reply.contains("result") ? reply["result"] : nlohmann::json();
}

void BridgeBackend::requireCapability(Capability capability) const {
    if (!supports(capability)) {
        throw BackendError(std::string(capabilityName(capability)) + " is not supported by " + getName());
    }
}

std::vector<DateLike> BridgeBackend::getTradingDates(const std::string& market) {
    auto result = call("get_trading_dates", {{"market", market}});
    std::vector<DateLike> dates;
    if (!result.is_array()) return dates;

    for (const auto& d : result) {
        if (d.is_number_integer()) {
            dates.emplace_back(d.get<long long>());
        } else if (d.is_string()) {
            dates.emplace_back(d.get<std::string>());
        } else if (d.is_object() && d.contains("epoch_ms") && d["epoch_ms"].is_number()) {
            auto ms = std::chrono::milliseconds(d["epoch_ms"].get<long long>());
            dates.emplace_back(std::chrono::system_clock::time_point(ms));
        } else {
            dates.emplace_back(d.dump());
        }
    }
    return dates;
}

std::vector<std::string> BridgeBackend::getStockListInSector(const std::string& sector) {
    auto result = call("get_stock_list_in_sector", {{"sector", sector}});
    std::vector<std::string> stocks;
    if (!result.is_array()) return stocks;

    for (const auto& s : result) {
        stocks.push_back(s.is_string() ? s.get<std::string>() : s.dump());
    }
    return stocks;
}

std::optional<nlohmann::json> BridgeBackend::getInstrumentDetail(const std::string& code, bool fullDetail) {
    auto result = call("get_instrument_detail", {{"code", code}, {"iscomplete", fullDetail}});
    if (result.is_null()) return std::nullopt;
    if (!result.is_object()) {
        throw BackendError("get_instrument_detail 返回了非对象结果");
    }
    return result;
}

std::optional<MarketDataFrame> BridgeBackend::getMarketData(const MarketDataQuery& query) {
    nlohmann::json params = {
        {"field_list", query.fields},
        {"stock_list", query.codes},
        {"period", query.period},
        {"start_time", query.startTime},
        {"end_time", query.endTime},
        {"count", query.count},
        {"dividend_type", query.dividendType},
        {"fill_data", query.fillData}
    };
    auto result = call("get_market_data", params);
    if (result.is_null()) return std::nullopt;
    if (!result.is_object()) {
        throw BackendError("get_market_data 返回了非对象结果");
    }

    MarketDataFrame frame;
    for (auto it = result.begin(); it != result.end(); ++it) {
        FieldSeries series;
        if (it.value().is_object()) {
            for (auto f = it.value().begin(); f != it.value().end(); ++f) {
                series[f.key()] = f.value();
            }
        }
        frame[it.key()] = std::move(series);
    }
    return frame;
}

BackendPanel BridgeBackend::createPanel(const PanelDescriptor& descriptor) {
    if (descriptor.stock.empty()) {
        throw BackendError("UIPanel 需要非空的 stock");
    }
    return {"UIPanel", descriptor.toJson()};
}

void BridgeBackend::start() {
    requireCapability(Capability::StartXtdata);
    call(capabilityName(Capability::StartXtdata), nlohmann::json::object());
}

void BridgeBackend::refreshUi() {
    requireCapability(Capability::RefreshUi);
    call(capabilityName(Capability::RefreshUi), nlohmann::json::object());
}

nlohmann::json BridgeBackend::invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) {
    requireCapability(method);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& p : panels) {
        nlohmann::json item = p.body;
        item["panel_type"] = p.typeName;
        list.push_back(item);
    }
    return call(capabilityName(method), {{"panels", list}});
}
