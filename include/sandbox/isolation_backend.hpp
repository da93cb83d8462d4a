#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/cancellation.hpp"
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 创建执行单元所需的全部信息
 */
struct unit_spec {
    /**
     * @brief 要运行的命令，argv[0] 为程序名
     */
    std::vector<std::string> command;

    /**
     * @brief 只读的工作区，存放选手代码和测试代码，也是程序的工作路径
     */
    std::filesystem::path workspace;

    /**
     * @brief 唯一可写的目录
     */
    std::filesystem::path scratch;

    /**
     * @brief 存放 stdout、stderr、meta 等运行记录的目录，不对程序可见
     */
    std::filesystem::path output_dir;

    /**
     * @brief 作为标准输入的文件
     */
    std::optional<std::filesystem::path> stdin_file;

    /**
     * @brief 额外的环境变量，形如 KEY=VALUE
     */
    std::vector<std::string> env;

    sandbox_limits limits;
};

/**
 * @brief 一个正在运行的执行单元
 * 由具体的隔离后端扩展，析构时不负责杀死进程，必须调用 isolation_backend::destroy
 */
struct execution_unit {
    explicit execution_unit(std::string id);
    virtual ~execution_unit();

    /**
     * @brief 执行单元的唯一标识，用于日志
     */
    const std::string id;
};

enum class unit_state {
    /**
     * @brief 程序自行退出或者因信号终止
     */
    EXITED,

    /**
     * @brief 程序超出时钟时间限制被杀死
     */
    TIMED_OUT,

    /**
     * @brief 取消标志被设置，执行单元被提前销毁
     */
    CANCELLED,

    /**
     * @brief 隔离后端本身出错
     */
    FAILED
};

struct unit_status {
    unit_state state = unit_state::FAILED;

    int exit_code = -1;

    /**
     * @brief 终止程序的信号，程序正常退出时为空
     */
    std::optional<int> signal;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    std::optional<int64_t> memory_used;

    /**
     * @brief state 为 FAILED 时的错误信息
     */
    std::string error;
};

struct unit_output {
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief 隔离后端
 * 沙箱通过这个接口启动、等待、读取和销毁执行单元。
 * 生产环境的实现是 runguard_backend，测试中可以替换为能观测并发数或注入错误的实现。
 * 实现必须是线程安全的，多个工作线程会同时调用。
 */
class isolation_backend {
public:
    virtual ~isolation_backend();

    /**
     * @brief 创建并启动一个执行单元
     * @throw sandbox_unavailable 当后端不可用、资源限制被拒绝或启动失败时
     */
    virtual std::unique_ptr<execution_unit> create(const unit_spec &spec) = 0;

    /**
     * @brief 等待执行单元结束或超时
     * @param cancel 可以为空，非空时会被轮询，取消后执行单元被提前杀死
     */
    virtual unit_status wait(execution_unit &unit, const cancellation_token *cancel) = 0;

    /**
     * @brief 读取执行单元的 stdout 和 stderr
     */
    virtual unit_output capture(execution_unit &unit) = 0;

    /**
     * @brief 销毁执行单元，确保所有进程都已被杀死，可以重复调用
     */
    virtual void destroy(execution_unit &unit) noexcept = 0;
};

}  // namespace grader
