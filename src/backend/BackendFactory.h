#pragma once
#include <memory>
#include "backend/IBackend.h"
#include "core/ConfigManager.h"

/**
 * @brief 进程启动时选择一次后端实现
 *
 * - mock:   总是使用 MockBackend
 * - bridge: 总是使用 BridgeBackend,不可达时以降级状态运行
 * - auto:   桥接服务探测成功则用 BridgeBackend,否则安装 MockBackend
 */
class BackendFactory {
public:
    static std::unique_ptr<IBackend> create(const Config::Backend& cfg);
};
