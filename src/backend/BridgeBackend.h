#pragma once
#include <set>
#include <string>
#include "backend/IBackend.h"

/**
 * @brief 真实后端适配器
 *
 * 通过本地 HTTP 桥接服务调用 xtquant 数据中心:
 * - GET  <prefix>/api/capabilities    返回 {"methods": [...]}
 * - POST <prefix>/api/<method>        请求体为 JSON 参数
 *
 * 桥接服务应答 {"ok": true, "result": ...} 或 {"ok": false, "error": "..."}。
 */
class BridgeBackend : public IBackend {
public:
    /**
     * @throws std::runtime_error baseUrl 中的端口不在 1..65535 范围内
     */
    BridgeBackend(const std::string& baseUrl,
                  int connectTimeoutSec = 3,
                  int readTimeoutSec = 30,
                  int maxRetries = 3);

    std::string getName() const override { return "BridgeXtdata"; }

    /**
     * @brief 探测桥接服务并读取可选能力列表
     * @return 服务可达且应答有效时返回 true
     */
    bool probe();

    std::vector<DateLike> getTradingDates(const std::string& market) override;
    std::vector<std::string> getStockListInSector(const std::string& sector) override;
    std::optional<nlohmann::json> getInstrumentDetail(const std::string& code, bool fullDetail) override;
    std::optional<MarketDataFrame> getMarketData(const MarketDataQuery& query) override;

    bool supports(Capability capability) const override {
        return capabilities.count(capability) > 0;
    }

    BackendPanel createPanel(const PanelDescriptor& descriptor) override;
    void start() override;
    void refreshUi() override;
    nlohmann::json invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) override;

private:
    std::string baseUrl;
    std::string host;
    int port = 80;
    std::string pathPrefix;
    int connectTimeout;
    int readTimeout;
    int maxRetries;
    std::set<Capability> capabilities;

    void parseBaseUrl(const std::string& url);

    /**
     * @brief 调用桥接方法,返回 result 字段; 失败时抛出 BackendError
     */
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    void requireCapability(Capability capability) const;
};
