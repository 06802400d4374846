#include "tools/PanelController.h"
#include "tools/ToolArguments.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <thread>

#ifdef _WIN32
    #include <process.h>
    #define getpid _getpid
#else
    #include <unistd.h>
#endif

namespace {

bool isAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string currentPlatform() {
#ifdef _WIN32
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

std::string currentUser() {
    for (const char* var : {"USERNAME", "USER"}) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }
    return "unknown";
}

} // namespace

PanelController::PanelController(ServiceLifecycle& lifecycle, MarketDataTools& marketData,
                                 std::chrono::milliseconds settleDelay)
    : lifecycle(lifecycle), marketData(marketData), settleDelay(settleDelay) {}

const std::vector<Capability>& PanelController::fallbackPanelMethods() {
    static const std::vector<Capability> methods = {
        Capability::ApplyPanelControl,
        Capability::CreatePanel,
        Capability::ShowPanel,
        Capability::DisplayPanel
    };
    return methods;
}

std::string PanelController::resolveCodes(const std::string& codes) {
    if (!codes.empty()) {
        return codes;
    }

    std::string resolved = kFallbackCodes;
    try {
        auto stocks = marketData.listStocks(kDefaultSector);
        if (stocks && !stocks.value().empty()) {
            std::vector<std::string> head(stocks.value().begin(),
                                          stocks.value().begin() + std::min(kDefaultStockCount, stocks.value().size()));
            resolved = ToolArguments::join(head);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("获取默认股票列表失败: ") + e.what());
    }

    Logger::getInstance().info("未提供codes参数，使用默认值: " + resolved);
    return resolved;
}

std::vector<ParamValue> PanelController::parsePositionalParams(const std::string& params) {
    std::vector<ParamValue> values;
    for (const auto& token : ToolArguments::splitCsv(params)) {
        if (isAllDigits(token)) {
            try {
                values.emplace_back(std::stoll(token));
                continue;
            } catch (const std::out_of_range&) {
                // 超出范围的数字按字符串保留
            }
        }
        values.emplace_back(token);
    }
    return values;
}

IndicatorConfig PanelController::buildChartIndicator(const std::string& indicator, const std::vector<ParamValue>& params) {
    IndicatorConfig config;
    config.indicatorName = indicator;

    if (indicator == "ma") {
        for (size_t i = 0; i < params.size(); ++i) {
            config.parameters.emplace_back("n" + std::to_string(i + 1), params[i]);
        }
    } else if (indicator == "macd") {
        if (params.size() >= 3) {
            config.parameters = {{"short", params[0]}, {"long", params[1]}, {"mid", params[2]}};
        }
    } else if (indicator == "kdj") {
        if (params.size() >= 3) {
            config.parameters = {{"n", params[0]}, {"m1", params[1]}, {"m2", params[2]}};
        }
    }
    return config;
}

ParamValue PanelController::parseLayoutValue(const std::string& raw) {
    std::string value = ToolArguments::trim(raw);
    try {
        size_t pos = 0;
        if (value.find('.') != std::string::npos) {
            double d = std::stod(value, &pos);
            if (pos == value.size()) return d;
        } else {
            long long i = std::stoll(value, &pos);
            if (pos == value.size()) return i;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return value;
}

IndicatorConfig PanelController::buildLayoutIndicator(const std::string& indicatorName,
                                                      const std::vector<std::string>& names,
                                                      const std::vector<ParamValue>& values) {
    IndicatorConfig config;
    config.indicatorName = indicatorName;
    size_t n = std::min(names.size(), values.size());
    for (size_t i = 0; i < n; ++i) {
        config.parameters.emplace_back(names[i], values[i]);
    }
    return config;
}

nlohmann::json PanelController::collectEnvInfo() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    const IBackend& backend = lifecycle.backend();

    return {
        {"platform", currentPlatform()},
        {"cwd", ec ? std::string("unknown") : cwd.u8string()},
        {"pid", static_cast<long long>(getpid())},
        {"user", currentUser()},
        {"backend_type", backend.getName()},
        {"backend_capabilities", backend.listCapabilities()},
        {"has_apply_ui_panel_control", backend.supports(Capability::ApplyUiPanelControl)},
        {"lifecycle_state", toString(lifecycle.getState())}
    };
}

void PanelController::applyPanels(const std::vector<std::string>& stocks,
                                  const std::string& period,
                                  const IndicatorConfig& indicator,
                                  nlohmann::json& panelInfo,
                                  nlohmann::json& methodResults) {
    auto& log = Logger::getInstance();
    IBackend& backend = lifecycle.backend();
    std::string figuresText = indicator.toJson().dump();

    std::vector<BackendPanel> panels;
    for (const auto& stock : stocks) {
        PanelDescriptor descriptor{stock, period, {indicator}};
        try {
            BackendPanel panel = backend.createPanel(descriptor);
            panelInfo.push_back({
                {"stock", stock},
                {"period", period},
                {"figures", figuresText},
                {"panel_type", panel.typeName},
                {"panel_str", panel.describe()}
            });
            panels.push_back(std::move(panel));
        } catch (const std::exception& e) {
            log.warn("创建UIPanel对象失败: " + std::string(e.what()));
            panels.push_back({"record", descriptor.toJson()});
            panelInfo.push_back({
                {"stock", stock},
                {"period", period},
                {"figures", figuresText},
                {"panel_type", "record"},
                {"error", e.what()}
            });
        }
    }

    auto invokeTimed = [&](Capability method) {
        const char* name = capabilityName(method);
        try {
            auto start = std::chrono::steady_clock::now();
            nlohmann::json result = backend.invokePanelMethod(method, panels);
            double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            methodResults[name] = {
                {"result", result.is_string() ? result.get<std::string>() : result.dump()},
                {"time_taken", seconds}
            };
            log.info(std::string(name) + "结果: " + methodResults[name]["result"].get<std::string>());
        } catch (const std::exception& e) {
            log.error("调用" + std::string(name) + "出错: " + e.what());
            methodResults[name] = {{"error", e.what()}};
        }
    };

    if (backend.supports(Capability::ApplyUiPanelControl)) {
        log.info("调用xtdata.apply_ui_panel_control(" + std::to_string(panels.size()) + " panels)");
        invokeTimed(Capability::ApplyUiPanelControl);
    } else {
        log.warn("后端没有apply_ui_panel_control方法");
        methodResults[capabilityName(Capability::ApplyUiPanelControl)] = {{"exists", false}};

        // 只尝试第一个存在的候补方法,失败也不再继续
        bool found = false;
        for (Capability method : fallbackPanelMethods()) {
            if (!backend.supports(method)) continue;
            log.info("尝试使用替代方法: " + std::string(capabilityName(method)));
            invokeTimed(method);
            found = true;
            break;
        }
        if (!found) {
            log.warn("无法找到合适的方法来显示图表面板");
            methodResults["no_method_found"] = true;
        }
    }

    if (backend.supports(Capability::RefreshUi)) {
        try {
            backend.refreshUi();
            methodResults[capabilityName(Capability::RefreshUi)] = {{"called", true}};
        } catch (const std::exception& e) {
            log.warn(std::string("调用refresh_ui出错: ") + e.what());
            methodResults[capabilityName(Capability::RefreshUi)] = {{"error", e.what()}};
        }
    }

    // 阻塞整个分发循环,等待后端异步刷新界面
    if (settleDelay.count() > 0) {
        std::this_thread::sleep_for(settleDelay);
    }
}

nlohmann::json PanelController::runPanelFlow(const std::vector<std::string>& stocks,
                                             const std::string& period,
                                             const IndicatorConfig& indicator,
                                             const std::string& successMessage,
                                             const nlohmann::json& details,
                                             const nlohmann::json& envInfo) {
    nlohmann::json panelInfo = nlohmann::json::array();
    nlohmann::json methodResults = nlohmann::json::object();

    try {
        applyPanels(stocks, period, indicator, panelInfo, methodResults);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("创建或应用面板时出错: ") + e.what());
        return {
            {"error", std::string("创建或应用面板时出错: ") + e.what()},
            {"debug_info", {
                {"env_info", envInfo},
                {"panel_info", panelInfo},
                {"method_results", methodResults}
            }}
        };
    }

    return {
        {"success", true},
        {"message", successMessage},
        {"details", details},
        {"debug_info", {
            {"env_info", envInfo},
            {"panel_info", panelInfo},
            {"method_results", methodResults}
        }}
    };
}

nlohmann::json PanelController::createChartPanel(const ChartPanelRequest& request) {
    try {
        lifecycle.ensureReady();
        nlohmann::json envInfo = collectEnvInfo();

        auto stocks = ToolArguments::splitCsv(resolveCodes(request.codes));
        if (stocks.empty()) {
            return {{"error", "未提供有效的股票代码"}, {"env_info", envInfo}};
        }

        auto params = PanelController::parsePositionalParams(request.params);
        IndicatorConfig indicator = buildChartIndicator(request.indicators, params);
        Logger::getInstance().info("创建图表面板: 股票=[" + ToolArguments::join(stocks) + "], 周期=" +
                                   request.period + ", 指标=" + indicator.toJson().dump());

        nlohmann::json parameters = nlohmann::json::array();
        for (const auto& p : params) parameters.push_back(paramValueToJson(p));

        nlohmann::json details = {
            {"stocks", stocks},
            {"period", request.period},
            {"indicator", request.indicators},
            {"parameters", parameters}
        };
        std::string message = "已成功创建 " + std::to_string(stocks.size()) + " 个图表面板";
        return runPanelFlow(stocks, request.period, indicator, message, details, envInfo);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("创建图表面板出错: ") + e.what());
        return {{"error", e.what()}, {"debug_info", nlohmann::json::object()}};
    }
}

nlohmann::json PanelController::createCustomLayout(const CustomLayoutRequest& request) {
    try {
        lifecycle.ensureReady();
        nlohmann::json envInfo = collectEnvInfo();

        auto stocks = ToolArguments::splitCsv(resolveCodes(request.codes));
        if (stocks.empty()) {
            return {{"error", "未提供有效的股票代码"}, {"env_info", envInfo}};
        }

        auto names = ToolArguments::splitCsv(request.paramNames);
        std::vector<ParamValue> values;
        for (const auto& raw : ToolArguments::splitCsv(request.paramValues)) {
            values.push_back(parseLayoutValue(raw));
        }
        IndicatorConfig indicator = buildLayoutIndicator(request.indicatorName, names, values);
        Logger::getInstance().info("创建自定义布局: 股票=[" + ToolArguments::join(stocks) + "], 周期=" +
                                   request.period + ", 指标=" + indicator.toJson().dump());

        nlohmann::json parameterValues = nlohmann::json::array();
        for (const auto& v : values) parameterValues.push_back(paramValueToJson(v));

        nlohmann::json details = {
            {"stocks", stocks},
            {"period", request.period},
            {"indicator", request.indicatorName},
            {"parameter_names", names},
            {"parameter_values", parameterValues}
        };
        std::string message = "已成功创建 " + std::to_string(stocks.size()) + " 个自定义布局面板";
        return runPanelFlow(stocks, request.period, indicator, message, details, envInfo);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("创建自定义布局出错: ") + e.what());
        return {{"error", e.what()}, {"debug_info", nlohmann::json::object()}};
    }
}
