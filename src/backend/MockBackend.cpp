#include "backend/MockBackend.h"
#include "utils/Logger.h"

namespace {
std::string joinCodes(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ",";
        out += items[i];
    }
    return out;
}
}

std::vector<DateLike> MockBackend::getTradingDates(const std::string& market) {
    Logger::getInstance().debug("模拟调用get_trading_dates(" + market + ")");
    return {std::string("2023-01-01"), std::string("2023-01-02"), std::string("2023-01-03")};
}

std::vector<std::string> MockBackend::getStockListInSector(const std::string& sector) {
    Logger::getInstance().debug("模拟调用get_stock_list_in_sector(" + sector + ")");
    return {"000001.SZ", "600519.SH", "300059.SZ"};
}

std::optional<nlohmann::json> MockBackend::getInstrumentDetail(const std::string& code, bool fullDetail) {
    Logger::getInstance().debug("模拟调用get_instrument_detail(" + code + ", " + (fullDetail ? "true" : "false") + ")");
    return nlohmann::json{
        {"code", code},
        {"name", "模拟股票"},
        {"price", 100.0}
    };
}

std::optional<MarketDataFrame> MockBackend::getMarketData(const MarketDataQuery& query) {
    Logger::getInstance().debug("模拟调用get_market_data([" + joinCodes(query.fields) + "], [" +
                                joinCodes(query.codes) + "], " + query.period + ", count=" +
                                std::to_string(query.count) + ")");
    MarketDataFrame result;
    for (const auto& stock : query.codes) {
        FieldSeries series;
        for (const auto& field : query.fields) {
            if (field == "close") {
                series[field] = {100.0, 101.0, 102.0};
            } else if (field == "open") {
                series[field] = {99.0, 100.0, 101.0};
            } else if (field == "high") {
                series[field] = {102.0, 103.0, 104.0};
            } else if (field == "low") {
                series[field] = {98.0, 99.0, 100.0};
            } else if (field == "volume") {
                series[field] = {10000, 12000, 15000};
            } else {
                series[field] = {0.0, 0.0, 0.0};
            }
        }
        result[stock] = std::move(series);
    }
    return result;
}

nlohmann::json MockBackend::invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) {
    if (method != Capability::ApplyUiPanelControl) {
        return IBackend::invokePanelMethod(method, panels);
    }
    Logger::getInstance().debug("模拟调用apply_ui_panel_control(" + std::to_string(panels.size()) + " panels)");
    return true;
}
