#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "backend/BackendTypes.h"

/**
 * @brief 把处理器输出转换为可安全传输的 JSON
 *
 * - ndarray 包装 {"__ndarray__": [...], ...} 展开为普通数组
 * - 非有限浮点 (NaN/Inf) 转为 null
 * - 对象和数组递归处理
 */
namespace ResultNormalizer {

nlohmann::json normalize(const nlohmann::json& value);

/**
 * @brief 单个字段序列转为有序数值数组
 *
 * 数组原样复制; ndarray 包装取其数据; 单个标量包装为单元素数组。
 */
nlohmann::json toSeries(const nlohmann::json& values);

/**
 * @brief code -> field -> 数组
 */
nlohmann::json normalizeMarketData(const MarketDataFrame& frame);

/**
 * @brief 合约详情: 标量字段原样保留,其余字段转为文本
 */
nlohmann::json normalizeInstrumentDetail(const nlohmann::json& detail);

/**
 * @brief 交易日期格式化
 *
 * 8 位整数 -> YYYY-MM-DD; 时间点 -> UTC 的 %Y-%m-%d; 其余按原样转为文本。
 */
std::string formatTradingDate(const DateLike& date);

/**
 * @brief 包装为 MCP content 数组: [{"type": "text", "text": <缩进 JSON>}]
 */
nlohmann::json toTextContent(const nlohmann::json& payload);

/**
 * @brief 纯文本 content,用于参数校验错误
 */
nlohmann::json toPlainTextContent(const std::string& text);

} // namespace ResultNormalizer
