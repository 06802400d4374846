#include "mcp/RequestDispatcher.h"
#include "tools/ResultNormalizer.h"
#include "tools/ToolArguments.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {

// 列表类工具的错误以单元素字符串数组返回
nlohmann::json renderList(const Result<nlohmann::json>& result) {
    if (result) return result.value();
    return nlohmann::json::array({"错误: " + result.error().message});
}

nlohmann::json renderObject(const Result<nlohmann::json>& result) {
    if (result) return result.value();
    return result.error().toJson();
}

} // namespace

RequestDispatcher::RequestDispatcher(std::unique_ptr<IBackend> backend, std::chrono::milliseconds settleDelay)
    : lifecycle(std::move(backend)),
      marketData(lifecycle),
      panels(lifecycle, marketData, settleDelay) {
    registerTools();
}

void RequestDispatcher::registerTools() {
    toolHandlers["get_trading_dates"] = [this](const nlohmann::json& a) { return tradingDates(a); };
    toolHandlers["get_stock_list"] = [this](const nlohmann::json& a) { return stockList(a); };
    toolHandlers["get_instrument_detail"] = [this](const nlohmann::json& a) { return instrumentDetail(a); };
    toolHandlers["get_history_market_data"] = [this](const nlohmann::json& a) { return historyMarketData(a); };
    toolHandlers["get_latest_market_data"] = [this](const nlohmann::json& a) { return latestMarketData(a); };
    toolHandlers["get_full_market_data"] = [this](const nlohmann::json& a) { return fullMarketData(a); };
    toolHandlers["create_chart_panel"] = [this](const nlohmann::json& a) { return chartPanel(a); };
    toolHandlers["create_custom_layout"] = [this](const nlohmann::json& a) { return customLayout(a); };

    for (const auto& spec : ToolRegistry::listTools()) {
        if (!toolHandlers.count(spec.name)) {
            Logger::getInstance().error("工具没有对应的处理器: " + spec.name);
        }
    }
}

nlohmann::json RequestDispatcher::listTools() const {
    return ToolRegistry::listToolSchemas();
}

nlohmann::json RequestDispatcher::callTool(const std::string& name, const nlohmann::json& arguments) {
    const ToolSpec* spec = ToolRegistry::find(name);
    auto it = toolHandlers.find(name);
    if (!spec || it == toolHandlers.end()) {
        throw UnknownToolError(name);
    }

    std::string missing = ToolArguments::findMissingRequired(*spec, arguments);
    if (!missing.empty()) {
        Logger::getInstance().warn(name + ": 缺少必要参数 '" + missing + "'");
        return ResultNormalizer::toPlainTextContent("错误: 缺少必要参数 '" + missing + "'");
    }

    nlohmann::json args = ToolArguments::applyDefaults(*spec, arguments);
    Logger::getInstance().debug("调用工具 " + name + ": " + args.dump());

    lifecycle.ensureReady();
    return ResultNormalizer::toTextContent(it->second(args));
}

nlohmann::json RequestDispatcher::tradingDates(const nlohmann::json& args) {
    return renderList(marketData.getTradingDates(ToolArguments::getString(args, "market", "SH")));
}

nlohmann::json RequestDispatcher::stockList(const nlohmann::json& args) {
    return renderList(marketData.getStockList(ToolArguments::getString(args, "sector", "沪深A股")));
}

nlohmann::json RequestDispatcher::instrumentDetail(const nlohmann::json& args) {
    return renderObject(marketData.getInstrumentDetail(ToolArguments::getString(args, "code"),
                                                       ToolArguments::getBool(args, "iscomplete")));
}

nlohmann::json RequestDispatcher::historyMarketData(const nlohmann::json& args) {
    return renderObject(marketData.getHistoryMarketData(MarketDataRequest::fromArguments(args)));
}

nlohmann::json RequestDispatcher::latestMarketData(const nlohmann::json& args) {
    return renderObject(marketData.getLatestMarketData(MarketDataRequest::fromArguments(args)));
}

nlohmann::json RequestDispatcher::fullMarketData(const nlohmann::json& args) {
    return renderObject(marketData.getFullMarketData(MarketDataRequest::fromArguments(args)));
}

nlohmann::json RequestDispatcher::chartPanel(const nlohmann::json& args) {
    ChartPanelRequest req;
    req.codes = ToolArguments::getString(args, "codes");
    req.period = ToolArguments::getString(args, "period", req.period);
    req.indicators = ToolArguments::getString(args, "indicators", req.indicators);
    req.params = ToolArguments::getString(args, "params", req.params);
    return panels.createChartPanel(req);
}

nlohmann::json RequestDispatcher::customLayout(const nlohmann::json& args) {
    CustomLayoutRequest req;
    req.codes = ToolArguments::getString(args, "codes");
    req.period = ToolArguments::getString(args, "period", req.period);
    req.indicatorName = ToolArguments::getString(args, "indicator_name", req.indicatorName);
    req.paramNames = ToolArguments::getString(args, "param_names", req.paramNames);
    req.paramValues = ToolArguments::getString(args, "param_values", req.paramValues);
    return panels.createCustomLayout(req);
}
