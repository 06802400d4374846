#include "backend/BackendFactory.h"
#include "backend/BridgeBackend.h"
#include "backend/MockBackend.h"
#include "utils/Logger.h"

std::unique_ptr<IBackend> BackendFactory::create(const Config::Backend& cfg) {
    auto& log = Logger::getInstance();

    if (cfg.mode == "mock") {
        log.info("使用模拟后端 (backend.mode = mock)");
        return std::make_unique<MockBackend>();
    }

    auto bridge = std::make_unique<BridgeBackend>(cfg.bridgeUrl, cfg.connectTimeout, cfg.readTimeout, cfg.maxRetries);
    bool reachable = bridge->probe();

    if (cfg.mode == "bridge") {
        if (!reachable) {
            log.error("xtquant 桥接服务不可用, 以降级状态继续: " + cfg.bridgeUrl);
        }
        return bridge;
    }

    if (!reachable) {
        log.warn("无法定位 xtquant 数据服务, 安装模拟后端");
        return std::make_unique<MockBackend>();
    }
    log.success("成功连接 xtquant 数据服务: " + cfg.bridgeUrl);
    return bridge;
}
