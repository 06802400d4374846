#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "backend/BackendFactory.h"
#include "core/ConfigManager.h"
#include "mcp/McpServer.h"
#include "mcp/RequestDispatcher.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {

const char* kDefaultConfigFile = "quantmcp.json";

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config_path] [--list-tools]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    bool listOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-tools") {
            listOnly = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            configPath = arg;
        }
    }

    Config cfg;
    try {
        if (!configPath.empty()) {
            cfg = Config::load(configPath);
        } else if (std::filesystem::exists(kDefaultConfigFile)) {
            cfg = Config::load(kDefaultConfigFile);
        } else {
            cfg = Config::defaults();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    auto& log = Logger::getInstance();
    log.setLogFile(cfg.logging.file);
    log.setDebugEnabled(cfg.logging.enableDebug);

    // 只列出工具,不连接后端
    if (listOnly) {
        std::cout << ToolRegistry::listToolSchemas().dump(2) << std::endl;
        return 0;
    }

    log.info("启动 " + cfg.server.name + " " + cfg.server.version + " (backend.mode=" + cfg.backend.mode + ")");

    std::unique_ptr<IBackend> backend;
    try {
        backend = BackendFactory::create(cfg.backend);
    } catch (const std::exception& e) {
        log.error(std::string("后端初始化失败: ") + e.what());
        return 1;
    }

    RequestDispatcher dispatcher(std::move(backend), std::chrono::milliseconds(cfg.panel.settleDelayMs));
    log.info("后端: " + dispatcher.getLifecycle().backend().getName());

    for (const auto& tool : ToolRegistry::listTools()) {
        log.info("已注册工具: " + tool.name);
    }

    McpServer server(dispatcher, cfg.server.name, cfg.server.version);
    server.run(std::cin, std::cout);
    return 0;
}
