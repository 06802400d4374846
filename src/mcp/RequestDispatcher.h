#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "backend/ServiceLifecycle.h"
#include "tools/MarketDataTools.h"
#include "tools/PanelController.h"
#include "utils/Result.h"

/**
 * @brief 工具调用分发器
 *
 * 独占持有 ServiceLifecycle (以及其中唯一的后端实例)。
 * callTool 流程: 查找工具 -> 必填检查 -> 填充默认值 -> ensureReady -> 处理器 -> 归一化为 content。
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(std::unique_ptr<IBackend> backend,
                               std::chrono::milliseconds settleDelay = std::chrono::milliseconds(500));

    /**
     * @brief MCP tools/list 的工具数组,顺序与 ToolRegistry 一致
     */
    nlohmann::json listTools() const;

    /**
     * @brief 调用工具
     * @return MCP content 数组
     * @throws UnknownToolError 工具名未注册
     *
     * 缺少必填参数时返回 "错误: 缺少必要参数 '<key>'" 文本,不触碰后端。
     */
    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments);

    ServiceLifecycle& getLifecycle() { return lifecycle; }

private:
    ServiceLifecycle lifecycle;
    MarketDataTools marketData;
    PanelController panels;

    using ToolHandler = std::function<nlohmann::json(const nlohmann::json&)>;
    std::map<std::string, ToolHandler> toolHandlers;

    void registerTools();

    nlohmann::json tradingDates(const nlohmann::json& args);
    nlohmann::json stockList(const nlohmann::json& args);
    nlohmann::json instrumentDetail(const nlohmann::json& args);
    nlohmann::json historyMarketData(const nlohmann::json& args);
    nlohmann::json latestMarketData(const nlohmann::json& args);
    nlohmann::json fullMarketData(const nlohmann::json& args);
    nlohmann::json chartPanel(const nlohmann::json& args);
    nlohmann::json customLayout(const nlohmann::json& args);
};
