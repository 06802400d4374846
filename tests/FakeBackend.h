#pragma once
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "backend/IBackend.h"
#include "utils/Logger.h"

// 测试中不写日志文件,也不输出到 stderr
inline void silenceLogger() {
    Logger::getInstance().setConsoleEnabled(false);
    Logger::getInstance().setLogFile("");
}

/**
 * @brief 可编排的测试后端,记录每次调用
 */
class FakeBackend : public IBackend {
public:
    // 脚本
    std::vector<DateLike> tradingDates;
    std::vector<std::string> stocks = {"000001.SZ", "600519.SH"};
    std::optional<nlohmann::json> instrumentDetail;
    bool returnNoMarketData = false;
    std::set<Capability> capabilities;
    std::set<Capability> failingMethods;
    bool failStart = false;
    bool failStockList = false;
    bool failMarketData = false;
    bool failCreatePanel = false;
    bool failRefresh = false;

    // 记录
    int startCount = 0;
    int refreshCount = 0;
    int backendCalls = 0;
    MarketDataQuery lastQuery;
    std::vector<Capability> invokedMethods;
    std::vector<BackendPanel> lastPanels;

    std::string getName() const override { return "FakeXtdata"; }

    std::vector<DateLike> getTradingDates(const std::string& market) override {
        (void)market;
        ++backendCalls;
        return tradingDates;
    }

    std::vector<std::string> getStockListInSector(const std::string& sector) override {
        (void)sector;
        ++backendCalls;
        if (failStockList) throw BackendError("sector lookup failed");
        return stocks;
    }

    std::optional<nlohmann::json> getInstrumentDetail(const std::string& code, bool fullDetail) override {
        (void)fullDetail;
        ++backendCalls;
        lastDetailCode = code;
        lastFullDetail = fullDetail;
        return instrumentDetail;
    }

    std::optional<MarketDataFrame> getMarketData(const MarketDataQuery& query) override {
        ++backendCalls;
        lastQuery = query;
        if (failMarketData) throw BackendError("bridge timeout");
        if (returnNoMarketData) return std::nullopt;

        MarketDataFrame frame;
        for (const auto& code : query.codes) {
            for (const auto& field : query.fields) {
                frame[code][field] = nlohmann::json::array({1.0, 2.0});
            }
        }
        return frame;
    }

    bool supports(Capability capability) const override {
        return capabilities.count(capability) > 0;
    }

    BackendPanel createPanel(const PanelDescriptor& descriptor) override {
        if (failCreatePanel) throw BackendError("UIPanel unavailable");
        return IBackend::createPanel(descriptor);
    }

    void start() override {
        ++startCount;
        if (failStart) throw BackendError("xtdata not running");
    }

    void refreshUi() override {
        ++refreshCount;
        if (failRefresh) throw BackendError("refresh failed");
    }

    nlohmann::json invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) override {
        invokedMethods.push_back(method);
        lastPanels = panels;
        if (failingMethods.count(method)) {
            throw BackendError(std::string(capabilityName(method)) + " failed");
        }
        return "ok";
    }

    std::string lastDetailCode;
    bool lastFullDetail = false;
};
