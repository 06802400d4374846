#include "mcp/McpServer.h"
#include "utils/Logger.h"
#include "utils/Result.h"

namespace {

// JSON-RPC 2.0 错误码
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

class MethodNotFoundError : public ProtocolError {
public:
    explicit MethodNotFoundError(const std::string& method)
        : ProtocolError(kMethodNotFound, "Method not found: " + method) {}
};

} // namespace

McpServer::McpServer(RequestDispatcher& dispatcher, const std::string& name, const std::string& version)
    : dispatcher(dispatcher), serverName(name), serverVersion(version) {}

nlohmann::json McpServer::makeResponse(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

std::string McpServer::readResource(const std::string& uri) const {
    throw UnsupportedUriError(uri);
}

nlohmann::json McpServer::getPrompt(const std::string& name, const nlohmann::json& arguments) const {
    (void)arguments;
    throw UnknownPromptError(name);
}

nlohmann::json McpServer::dispatchMethod(const std::string& method, const nlohmann::json& params) {
    if (method == "initialize") {
        return {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {
                {"tools", nlohmann::json::object()},
                {"resources", nlohmann::json::object()},
                {"prompts", nlohmann::json::object()}
            }},
            {"serverInfo", {{"name", serverName}, {"version", serverVersion}}}
        };
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    if (method == "tools/list") {
        return {{"tools", dispatcher.listTools()}};
    }
    if (method == "tools/call") {
        std::string name = params.value("name", "");
        nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
        if (arguments.is_null()) arguments = nlohmann::json::object();
        Logger::getInstance().info("tools/call " + name);
        return {{"content", dispatcher.callTool(name, arguments)}, {"isError", false}};
    }
    if (method == "resources/list") {
        return {{"resources", listResources()}};
    }
    if (method == "resources/read") {
        std::string uri = params.value("uri", "");
        return {{"contents", nlohmann::json::array({{{"uri", uri}, {"text", readResource(uri)}}})}};
    }
    if (method == "prompts/list") {
        return {{"prompts", listPrompts()}};
    }
    if (method == "prompts/get") {
        return getPrompt(params.value("name", ""), params.value("arguments", nlohmann::json::object()));
    }
    throw MethodNotFoundError(method);
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& request) {
    if (!request.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    bool isNotification = !request.contains("id");
    nlohmann::json id = request.value("id", nlohmann::json());
    if (request.contains("method") && !request["method"].is_string()) {
        return makeError(id, kInvalidRequest, "Invalid Request: method must be a string");
    }
    std::string method = request.value("method", "");

    if (method.rfind("notifications/", 0) == 0) {
        Logger::getInstance().debug("收到通知: " + method);
        return std::nullopt;
    }
    if (method.empty()) {
        return makeError(id, kInvalidRequest, "Invalid Request: missing method");
    }

    nlohmann::json params = request.value("params", nlohmann::json::object());
    if (!params.is_object()) params = nlohmann::json::object();

    try {
        nlohmann::json result = dispatchMethod(method, params);
        if (isNotification) return std::nullopt;
        return makeResponse(id, result);
    } catch (const ProtocolError& e) {
        Logger::getInstance().warn(method + ": " + e.what());
        if (isNotification) return std::nullopt;
        return makeError(id, e.code(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(method + " 处理失败: " + e.what());
        if (isNotification) return std::nullopt;
        return makeError(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

std::optional<std::string> McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("无法解析请求: ") + e.what());
        return makeError(nullptr, kParseError, std::string("Parse error: ") + e.what())
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto response = handleMessage(request);
    if (!response) return std::nullopt;
    return response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void McpServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info("MCP 服务已启动: " + serverName + " " + serverVersion);

    std::string line;
    while (std::getline(in, line)) {
        auto response = handleLine(line);
        if (response) {
            out << *response << std::endl;
        }
    }

    Logger::getInstance().info("输入流已关闭, MCP 服务退出");
}
