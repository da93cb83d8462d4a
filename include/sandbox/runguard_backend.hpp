#pragma once

#include <sys/types.h>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "sandbox/isolation_backend.hpp"

namespace grader {

struct runguard_backend_options {
    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard;

    /**
     * @brief 以该用户运行选手程序，为空时使用当前用户（root 会被清空能力集）
     */
    std::optional<std::string> run_user;

    std::optional<std::string> run_group;

    /**
     * @brief 是否使用 cgroup 限制内存和 CPU 份额
     */
    bool use_cgroup = true;

    /**
     * @brief 是否分离命名空间并以只读方式挂载工作区，需要 root 权限
     */
    bool isolate = false;

    /**
     * @brief runguard 本身超过时钟时间限制多久之后被强制杀死，单位为秒
     */
    double grace_period = 2;
};

/**
 * @brief 通过 runguard 运行执行单元的隔离后端
 * 每个执行单元对应一个 runguard 进程。
 * 后端在使用前必须 open()，在程序退出前 close()，关闭后 create() 会抛出 sandbox_unavailable。
 */
class runguard_backend : public isolation_backend {
public:
    explicit runguard_backend(runguard_backend_options options);
    ~runguard_backend() override;

    /**
     * @brief 检查 runguard 是否可用，并开始接受执行单元
     * @throw sandbox_unavailable 当 runguard 不存在或无法运行时
     */
    void open();

    /**
     * @brief 停止接受执行单元，并终止所有还在运行的执行单元
     */
    void close() noexcept;

    bool is_open() const;

    /**
     * @brief 还没有被 destroy 的执行单元数量
     */
    std::size_t live_units() const;

    std::unique_ptr<execution_unit> create(const unit_spec &spec) override;
    unit_status wait(execution_unit &unit, const cancellation_token *cancel) override;
    unit_output capture(execution_unit &unit) override;
    void destroy(execution_unit &unit) noexcept override;

private:
    struct runguard_unit;

    std::vector<std::string> build_command(const unit_spec &spec, const runguard_unit &unit) const;

    runguard_backend_options options;
    mutable std::mutex mtx;
    bool opened = false;
    std::set<runguard_unit *> live;
};

}  // namespace grader
