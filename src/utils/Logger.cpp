#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string trimTrailingNewlines(std::string msg) {
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
            msg.pop_back();
        }
        return msg;
    }
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFile.empty()) return;

    std::ofstream out(logFile, std::ios::app);
    if (!out.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    out << std::put_time(std::localtime(&now), "[%Y-%m-%d %H:%M:%S] ");
    switch (level) {
        case LogLevel::ERROR: out << "[ERROR] "; break;
        case LogLevel::WARNING: out << "[WARN] "; break;
        case LogLevel::INFO: out << "[INFO] "; break;
        case LogLevel::SUCCESS: out << "[OK] "; break;
        default: out << "[DEBUG] "; break;
    }
    out << trimTrailingNewlines(message) << std::endl;
}

void Logger::printToStderr(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
    }

    // 多行消息每行都带前缀
    std::stringstream ss(trimTrailingNewlines(message));
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
