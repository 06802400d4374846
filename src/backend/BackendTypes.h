#pragma once
#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief 交易日期的三种可能形态: YYYYMMDD 整数、字符串、时间点
 */
using DateLike = std::variant<long long, std::string, std::chrono::system_clock::time_point>;

/**
 * @brief 行情数据: code -> field -> 序列
 *
 * 序列保持后端原样 (数组或 ndarray 包装),由 ResultNormalizer 统一转换。
 */
using FieldSeries = std::map<std::string, nlohmann::json>;
using MarketDataFrame = std::map<std::string, FieldSeries>;

/**
 * @brief 行情查询参数
 */
struct MarketDataQuery {
    std::vector<std::string> fields;
    std::vector<std::string> codes;
    std::string period = "1d";
    std::string startTime;
    std::string endTime;
    int count = -1;  // -1 表示不限条数
    std::string dividendType = "none";
    bool fillData = true;
};

/**
 * @brief 指标参数值: 整数、浮点或字符串
 */
using ParamValue = std::variant<long long, double, std::string>;

nlohmann::json paramValueToJson(const ParamValue& value);

struct IndicatorConfig {
    std::string indicatorName;
    std::vector<std::pair<std::string, ParamValue>> parameters;

    // {"ma": {"n1": 5, "n2": 10}}
    nlohmann::json toJson() const;
};

struct PanelDescriptor {
    std::string stock;
    std::string period;
    std::vector<IndicatorConfig> figures;

    nlohmann::json toJson() const;
};

/**
 * @brief 后端生成的面板对象
 *
 * typeName 为后端面板类型 ("UIPanel" 等); 无法构造时由调用方退化为 "record"。
 */
struct BackendPanel {
    std::string typeName;
    nlohmann::json body;

    std::string describe() const;
};

/**
 * @brief 后端的可选能力
 *
 * 面板控制的候选方法按此处声明顺序协商。
 */
enum class Capability {
    StartXtdata,
    RefreshUi,
    ApplyUiPanelControl,
    ApplyPanelControl,
    CreatePanel,
    ShowPanel,
    DisplayPanel
};

const char* capabilityName(Capability capability);

/**
 * @brief 按名称查找能力,未知名称返回 false
 */
bool capabilityFromName(const std::string& name, Capability& out);

const std::vector<Capability>& allCapabilities();
