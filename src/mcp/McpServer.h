#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/RequestDispatcher.h"

/**
 * @brief MCP 服务端
 *
 * 通过 stdin/stdout 以逐行 JSON-RPC 2.0 通信:
 * - initialize: 能力协商
 * - tools/list, tools/call: 交给 RequestDispatcher
 * - resources/*, prompts/*: 不提供任何资源与提示
 *
 * 处理器抛出的 ProtocolError 转为对应错误码,其他异常转为 -32603,循环不会因此退出。
 */
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    McpServer(RequestDispatcher& dispatcher, const std::string& name, const std::string& version);

    /**
     * @brief 读取输入直到 EOF,每行一个请求
     */
    void run(std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * @brief 处理一行原始输入
     * @return 需要回写的响应; 通知或空行返回 std::nullopt
     */
    std::optional<std::string> handleLine(const std::string& line);

    /**
     * @brief 处理一个已解析的请求
     */
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& request);

    nlohmann::json listResources() const { return nlohmann::json::array(); }

    /**
     * @throws UnsupportedUriError 总是抛出
     */
    std::string readResource(const std::string& uri) const;

    nlohmann::json listPrompts() const { return nlohmann::json::array(); }

    /**
     * @throws UnknownPromptError 总是抛出
     */
    nlohmann::json getPrompt(const std::string& name, const nlohmann::json& arguments) const;

private:
    RequestDispatcher& dispatcher;
    std::string serverName;
    std::string serverVersion;

    nlohmann::json dispatchMethod(const std::string& method, const nlohmann::json& params);

    static nlohmann::json makeResponse(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
};
