#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/ServiceLifecycle.h"
#include "utils/Result.h"

/**
 * @brief 行情请求参数
 *
 * codes/fields 由逗号分隔字符串切分得到,保持原顺序,不去重。
 * fields 为空时使用 OHLCV 五个字段。
 */
struct MarketDataRequest {
    std::vector<std::string> codes;
    std::string period = "1d";
    std::string startDate;
    std::string endDate;
    std::vector<std::string> fields;

    static MarketDataRequest fromArguments(const nlohmann::json& args);
};

const std::vector<std::string>& defaultMarketFields();

/**
 * @brief 最小的代码形态检查: 含 '.' 且长度不少于 6
 */
bool looksLikeInstrumentCode(const std::string& code);

/**
 * @brief 行情类工具处理器
 *
 * 每个处理器先确保后端已初始化,然后调用后端并归一化结果。
 * 处理器从不抛出,所有失败都以 ErrorPayload 返回。
 */
class MarketDataTools {
public:
    static constexpr size_t kMaxTradingDates = 30;
    static constexpr size_t kMaxStocks = 50;

    explicit MarketDataTools(ServiceLifecycle& lifecycle);

    /**
     * @brief 最近 30 个交易日,格式化为 YYYY-MM-DD
     * @return 字符串数组; 后端无数据时为 ["未找到交易日期数据"]
     */
    Result<nlohmann::json> getTradingDates(const std::string& market);

    /**
     * @brief 板块股票列表,至多前 50 个; 空列表原样返回
     */
    Result<std::vector<std::string>> listStocks(const std::string& sector);

    /**
     * @brief get_stock_list 工具: 空列表时返回单条说明文字
     */
    Result<nlohmann::json> getStockList(const std::string& sector);

    Result<nlohmann::json> getInstrumentDetail(const std::string& code, bool fullDetail);

    /**
     * @brief 历史行情,不做代码形态过滤,不指定条数
     */
    Result<nlohmann::json> getHistoryMarketData(const MarketDataRequest& request);

    /**
     * @brief 最新一条 OHLCV,忽略调用方传入的字段
     */
    Result<nlohmann::json> getLatestMarketData(const MarketDataRequest& request);

    /**
     * @brief 历史+最新行情,过滤代码形态,不限条数
     */
    Result<nlohmann::json> getFullMarketData(const MarketDataRequest& request);

private:
    ServiceLifecycle& lifecycle;

    IBackend& backend();

    Result<nlohmann::json> queryMarketData(const MarketDataQuery& query, const std::string& label);
};
