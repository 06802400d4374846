#pragma once
#include "backend/IBackend.h"

/**
 * @brief 模拟后端
 *
 * 找不到真实数据服务时自动安装,返回固定的示例数据。
 */
class MockBackend : public IBackend {
public:
    MockBackend() = default;

    std::string getName() const override { return "MockXtdata"; }

    std::vector<DateLike> getTradingDates(const std::string& market) override;
    std::vector<std::string> getStockListInSector(const std::string& sector) override;
    std::optional<nlohmann::json> getInstrumentDetail(const std::string& code, bool fullDetail) override;
    std::optional<MarketDataFrame> getMarketData(const MarketDataQuery& query) override;

    bool supports(Capability capability) const override {
        return capability == Capability::ApplyUiPanelControl;
    }

    nlohmann::json invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) override;
};
