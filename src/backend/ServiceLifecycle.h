#pragma once
#include <memory>
#include "backend/IBackend.h"

/**
 * @brief 后端生命周期守卫
 *
 * 独占持有唯一的后端实例,保证 start_xtdata 在进程内至多执行一次。
 * 状态只会从 Uninitialized 转到 Ready 或 FailedButContinuing,之后不再重试。
 *
 * 检查-设置不是原子的: 调用方必须串行处理工具调用。
 * 改为多线程分发时需在 ensureReady() 外加锁。
 */
class ServiceLifecycle {
public:
    enum class State {
        Uninitialized,
        Ready,
        FailedButContinuing
    };

    explicit ServiceLifecycle(std::unique_ptr<IBackend> backend);

    /**
     * @brief 首次调用时启动后端,之后均为空操作。从不抛出。
     */
    State ensureReady();

    State getState() const { return state; }

    IBackend& backend() { return *backendImpl; }
    const IBackend& backend() const { return *backendImpl; }

private:
    std::unique_ptr<IBackend> backendImpl;
    State state = State::Uninitialized;
};

const char* toString(ServiceLifecycle::State state);
