#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

/**
 * @brief 进程级日志器
 *
 * 记录同时写入日志文件和 stderr。stdout 专用于协议帧,任何日志都不得写入。
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    /**
     * @brief 设置日志文件路径,空字符串表示不写文件
     */
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFile = path;
    }

    void setDebugEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;

        writeToFile(level, message);
        if (consoleEnabled) {
            printToStderr(level, message);
        }

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    std::string logFile = "quantmcp.log";
    bool debugEnabled = false;
    bool consoleEnabled = true;

    void writeToFile(LogLevel level, const std::string& message);
    void printToStderr(LogLevel level, const std::string& message);
};
