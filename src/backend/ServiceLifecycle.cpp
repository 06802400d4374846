#include "backend/ServiceLifecycle.h"
#include "backend/MockBackend.h"
#include "utils/Logger.h"

ServiceLifecycle::ServiceLifecycle(std::unique_ptr<IBackend> backend)
    : backendImpl(std::move(backend)) {
    if (!backendImpl) {
        Logger::getInstance().warn("未提供后端实例, 安装模拟后端");
        backendImpl = std::make_unique<MockBackend>();
    }
}

ServiceLifecycle::State ServiceLifecycle::ensureReady() {
    if (state != State::Uninitialized) {
        return state;
    }

    auto& log = Logger::getInstance();
    try {
        if (backendImpl->supports(Capability::StartXtdata)) {
            backendImpl->start();
        }
        state = State::Ready;
        log.success("XTQuant数据中心已初始化 (" + backendImpl->getName() + ")");
    } catch (const std::exception& e) {
        state = State::FailedButContinuing;
        log.error(std::string("初始化XTQuant数据中心失败: ") + e.what());
    }
    return state;
}

const char* toString(ServiceLifecycle::State state) {
    switch (state) {
        case ServiceLifecycle::State::Uninitialized: return "uninitialized";
        case ServiceLifecycle::State::Ready: return "ready";
        case ServiceLifecycle::State::FailedButContinuing: return "failed";
    }
    return "unknown";
}
