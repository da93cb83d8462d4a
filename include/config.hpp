#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "validate/security_gate.hpp"

namespace grader {

/**
 * @brief 评测系统的全部配置
 * 先从 JSON 配置文件读取，再被命令行参数覆盖，最后缺失的路径从环境变量
 * RUNGUARD、RUNDIR、PYTHON、DEBUG 补全
 */
struct grader_config {
    /**
     * @brief 默认的时钟时间限制，也是单个请求能设置的上限，单位为秒
     */
    double timeout = 30;

    /**
     * @brief 默认的内存限制，也是单个请求能设置的上限，单位为字节
     */
    int64_t memory_limit = 128ll << 20;

    /**
     * @brief 每个执行单元可以使用的 CPU 份额（单核的比例）
     */
    double cpu_share = 0.5;

    std::size_t nproc = 64;

    int64_t file_limit = 16ll << 20;

    /**
     * @brief stdout、stderr 各自保留的最大字节数
     */
    int64_t stream_size = 1ll << 20;

    /**
     * @brief 批量评测时同时运行的最大任务数
     */
    std::size_t max_concurrent = 5;

    /**
     * @brief 一批最多包含的提交数
     */
    std::size_t max_batch_size = 100;

    /**
     * @brief 单个提交代码的最大字节数
     */
    std::size_t max_source_size = 1 << 20;

    /**
     * @brief 是否在调用线程中逐个评测
     */
    bool sequential = false;

    /**
     * @brief 为真时安全检查的风险标记也会导致拒绝
     */
    bool risks_fatal = false;

    std::vector<deny_pattern> deny_patterns = default_deny_patterns();

    /**
     * @brief 工作区的根目录
     */
    std::filesystem::path run_dir;

    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard;

    /**
     * @brief 执行单元中使用的 Python 解释器
     */
    std::string python = "python3";

    std::string run_user;

    std::string run_group;

    /**
     * @brief 是否分离命名空间（需要 root 权限）
     */
    bool isolate = false;

    /**
     * @brief 是否使用 cgroup（需要 root 权限和 cgroup v1）
     */
    bool use_cgroup = true;

    /**
     * @brief 是否开启 DEBUG 模式
     * 如果开启 DEBUG 模式，评测系统不会删除产生的工作区，以便手动检查测试产生的文件内容是否符合预期。
     */
    bool debug = false;
};

/**
 * @brief 解析内存大小，接受字节数或者带 k、m、g 后缀的字符串（如 "128m"）
 * @throw config_error 当格式不合法时
 */
int64_t parse_memory_size(const std::string &text);

void from_json(const nlohmann::json &j, grader_config &config);

void to_json(nlohmann::json &j, const grader_config &config);

/**
 * @brief 从 JSON 文件中读取配置，文件中没有的项保持默认值
 * @throw config_error 当文件不存在或格式不合法时
 */
grader_config load_config(const std::filesystem::path &path);

/**
 * @brief 检查配置的取值范围
 * @throw config_error 当取值不合法时
 */
void check_config(const grader_config &config);

}  // namespace grader
