#pragma once
#include <string>
#include <stdexcept>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

/**
 * @brief 错误分类
 *
 * - Validation: 缺少必要参数,由分发器就地转换为错误文本
 * - Backend: 调用后端失败,在处理器边界捕获
 * - Lifecycle: 后端启动失败,只记录日志
 * - Protocol: 未知工具/提示/资源,唯一允许以协议错误抛出的类别
 */
enum class ErrorKind {
    Validation,
    Backend,
    Lifecycle,
    Protocol
};

/**
 * @brief 处理器返回的结构化错误
 */
struct ErrorPayload {
    ErrorKind kind = ErrorKind::Backend;
    std::string message;
    nlohmann::json debugInfo;  // null 表示没有调试信息

    nlohmann::json toJson() const {
        nlohmann::json j = {{"error", message}};
        if (!debugInfo.is_null()) {
            j["debug_info"] = debugInfo;
        }
        return j;
    }
};

/**
 * @brief 处理器结果: 要么是值,要么是 ErrorPayload
 */
template <typename T>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result fail(ErrorPayload error) { return Result(std::move(error)); }

    static Result fail(ErrorKind kind, const std::string& message,
                       nlohmann::json debugInfo = nullptr) {
        return Result(ErrorPayload{kind, message, std::move(debugInfo)});
    }

    bool isOk() const { return std::holds_alternative<T>(data); }
    explicit operator bool() const { return isOk(); }

    const T& value() const { return std::get<T>(data); }
    T& value() { return std::get<T>(data); }
    const ErrorPayload& error() const { return std::get<ErrorPayload>(data); }

private:
    explicit Result(T value) : data(std::move(value)) {}
    explicit Result(ErrorPayload error) : data(std::move(error)) {}

    std::variant<T, ErrorPayload> data;
};

/**
 * @brief 后端调用失败 (网络、桥接服务返回错误等)
 */
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief 协议层错误,携带 JSON-RPC 错误码
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    int code() const { return errorCode; }

private:
    int errorCode;
};

class UnknownToolError : public ProtocolError {
public:
    explicit UnknownToolError(const std::string& name)
        : ProtocolError(-32602, "Unknown tool: " + name) {}
};

class UnknownPromptError : public ProtocolError {
public:
    explicit UnknownPromptError(const std::string& name)
        : ProtocolError(-32602, "Unknown prompt: " + name) {}
};

class UnsupportedUriError : public ProtocolError {
public:
    explicit UnsupportedUriError(const std::string& uri)
        : ProtocolError(-32602, "Unsupported URI: " + uri) {}
};
