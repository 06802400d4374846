#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/ServiceLifecycle.h"
#include "tools/MarketDataTools.h"

/**
 * @brief create_chart_panel 参数
 */
struct ChartPanelRequest {
    std::string codes;   // 为空时自动取默认股票
    std::string period = "1d";
    std::string indicators = "ma";
    std::string params = "5,10,20";
};

/**
 * @brief create_custom_layout 参数
 */
struct CustomLayoutRequest {
    std::string codes;
    std::string period = "1d";
    std::string indicatorName = "ma";
    std::string paramNames = "n1,n2,n3";
    std::string paramValues = "5,10,20";
};

/**
 * @brief 面板控制器
 *
 * 流程:
 * 1. 解析股票代码 (缺省时取沪深A股前 5 只,失败回退到固定的两只)
 * 2. 解析指标参数
 * 3. 每只股票构造一个 PanelDescriptor
 * 4. 调用 apply_ui_panel_control; 不存在时按顺序尝试候补方法
 * 5. 尽力调用 refresh_ui
 * 6. 短暂等待 UI 更新
 * 7. 返回结果与调试信息
 *
 * 整个调用从不抛出。
 */
class PanelController {
public:
    static constexpr const char* kDefaultSector = "沪深A股";
    static constexpr const char* kFallbackCodes = "000001.SZ,600519.SH";
    static constexpr size_t kDefaultStockCount = 5;

    PanelController(ServiceLifecycle& lifecycle, MarketDataTools& marketData,
                    std::chrono::milliseconds settleDelay = std::chrono::milliseconds(500));

    nlohmann::json createChartPanel(const ChartPanelRequest& request);

    nlohmann::json createCustomLayout(const CustomLayoutRequest& request);

    /**
     * @brief codes 为空时推导默认股票代码 (逗号分隔)
     */
    std::string resolveCodes(const std::string& codes);

    /**
     * @brief 候补面板方法,按尝试顺序排列
     */
    static const std::vector<Capability>& fallbackPanelMethods();

    /**
     * @brief create_chart_panel 的位置参数: 纯数字转为整数,其余保留字符串
     */
    static std::vector<ParamValue> parsePositionalParams(const std::string& params);

    /**
     * @brief 按指标名把位置参数映射为命名参数
     *
     * ma -> n1..nK; macd -> short/long/mid; kdj -> n/m1/m2 (需至少 3 个,否则为空);
     * 其他指标参数为空。
     */
    static IndicatorConfig buildChartIndicator(const std::string& indicator, const std::vector<ParamValue>& params);

    /**
     * @brief create_custom_layout 的参数值: 整数 > 含 '.' 的浮点 > 字符串
     */
    static ParamValue parseLayoutValue(const std::string& raw);

    /**
     * @brief 参数名与参数值按位置配对,多余的名称或值被丢弃
     */
    static IndicatorConfig buildLayoutIndicator(const std::string& indicatorName,
                                                const std::vector<std::string>& names,
                                                const std::vector<ParamValue>& values);

private:
    ServiceLifecycle& lifecycle;
    MarketDataTools& marketData;
    std::chrono::milliseconds settleDelay;

    nlohmann::json collectEnvInfo();

    /**
     * @brief 步骤 3-6: 构造描述符、应用到后端、刷新并等待
     *
     * panelInfo/methodResults 随执行逐步填充,抛出时保留已收集的部分。
     */
    void applyPanels(const std::vector<std::string>& stocks,
                     const std::string& period,
                     const IndicatorConfig& indicator,
                     nlohmann::json& panelInfo,
                     nlohmann::json& methodResults);

    nlohmann::json runPanelFlow(const std::vector<std::string>& stocks,
                                const std::string& period,
                                const IndicatorConfig& indicator,
                                const std::string& successMessage,
                                const nlohmann::json& details,
                                const nlohmann::json& envInfo);
};
