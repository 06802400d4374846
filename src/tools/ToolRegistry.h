#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief 单个参数的声明
 *
 * autoFilled 表示缺省时由处理器推导 (例如面板工具的 codes),schema 中不给默认值,只标注 x-auto-filled。
 */
struct ParamSpec {
    std::string key;
    std::string type;
    std::string description;
    bool required = false;
    std::optional<nlohmann::json> defaultValue;
    bool autoFilled = false;
};

struct ToolSpec {
    std::string name;
    std::string description;
    std::vector<ParamSpec> parameters;

    const ParamSpec* findParam(const std::string& key) const;

    /**
     * @brief 生成 MCP tools/list 中的单个工具定义
     *
     * 格式:
     * {
     *   "name": "...",
     *   "description": "...",
     *   "inputSchema": {"type": "object", "properties": {...}, "required": [...]}
     * }
     */
    nlohmann::json toJson() const;
};

/**
 * @brief 工具目录
 *
 * 静态、只读。listTools() 的顺序即协议中的工具顺序。
 */
class ToolRegistry {
public:
    static const std::vector<ToolSpec>& listTools();

    /**
     * @brief 按名称查找工具
     * @return 不存在时返回 nullptr
     */
    static const ToolSpec* find(const std::string& name);

    static bool hasTool(const std::string& name) { return find(name) != nullptr; }

    static nlohmann::json listToolSchemas();
};
