#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ToolRegistry.h"

/**
 * @brief 工具参数读取辅助
 *
 * 只做必填检查和默认值填充,不做类型校验。
 */
namespace ToolArguments {

/**
 * @brief 值是否视为"未提供": 缺失、null 或空字符串
 */
bool isMissing(const nlohmann::json& args, const std::string& key);

/**
 * @brief 返回第一个缺失的必填参数名,全部存在时返回空字符串
 */
std::string findMissingRequired(const ToolSpec& spec, const nlohmann::json& args);

/**
 * @brief 用 ToolSpec 中声明的默认值补齐缺失参数
 */
nlohmann::json applyDefaults(const ToolSpec& spec, const nlohmann::json& args);

/**
 * @brief 以字符串读取参数
 *
 * 字符串原样返回; 数组按逗号拼接; 其他标量转为文本; 缺失或 null 返回 fallback。
 */
std::string getString(const nlohmann::json& args, const std::string& key, const std::string& fallback = "");

/**
 * @brief 布尔参数: 原生 bool,或不区分大小写等于 "true" 的字符串; 其余一律为 false
 */
bool getBool(const nlohmann::json& args, const std::string& key);

/**
 * @brief 逗号切分并去除首尾空白,丢弃空项
 */
std::vector<std::string> splitCsv(const std::string& text);

std::string trim(const std::string& text);

std::string join(const std::vector<std::string>& items, const std::string& sep = ",");

} // namespace ToolArguments
