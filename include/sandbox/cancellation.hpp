#pragma once

#include <atomic>

namespace grader {

/**
 * @brief 批量任务共享的取消标志
 * 正在等待的执行单元会轮询这个标志，发现取消后立即销毁执行单元
 */
class cancellation_token {
public:
    void cancel() noexcept { cancelled_flag.store(true); }

    bool cancelled() const noexcept { return cancelled_flag.load(); }

private:
    std::atomic<bool> cancelled_flag{false};
};

}  // namespace grader
