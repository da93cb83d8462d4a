#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/cancellation.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 执行单元中指向 scratch 目录的环境变量
 */
constexpr const char *SCRATCH_ENV = "SCRATCH_DIR";

/**
 * @brief 一次沙箱执行的输入
 */
struct sandbox_task {
    /**
     * @brief 要执行的命令，工作路径为 workspace
     */
    std::vector<std::string> command;

    /**
     * @brief 写入 workspace 的文件，文件名到文件内容
     */
    std::map<std::string, std::string> input_files;

    sandbox_limits limits;

    std::optional<std::string> stdin_data;

    /**
     * @brief 执行结束后从 scratch 中读回的文件名
     */
    std::vector<std::string> collect;

    /**
     * @brief 额外的环境变量，形如 KEY=VALUE
     */
    std::vector<std::string> env;
};

/**
 * @brief 在隔离后端之上管理工作区的生命周期
 * 每次 run 都会创建独立的工作区，启动恰好一个执行单元，结束后无论成功、超时还是出错都会清理。
 */
class sandbox {
public:
    /**
     * @param backend 隔离后端，生命周期必须长于 sandbox
     * @param run_dir 工作区的根目录
     * @param keep_workspaces 为真时不删除工作区（DEBUG 模式）
     */
    sandbox(isolation_backend &backend, std::filesystem::path run_dir, bool keep_workspaces = false);

    /**
     * @brief 在隔离环境中执行命令
     * 所有错误都转换为 execution_result 中的字段，不会抛出异常
     * @param cancel 可以为空，取消后正在运行的执行单元会被提前销毁
     */
    execution_result run(const sandbox_task &task, const cancellation_token *cancel = nullptr) noexcept;

    isolation_backend &backend() const;

private:
    isolation_backend &isolation;
    std::filesystem::path run_dir;
    bool keep_workspaces;
};

}  // namespace grader
