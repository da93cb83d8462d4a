#pragma once

#include <cstdint>
#include <cstddef>

namespace grader {

/**
 * @brief 一个执行单元的资源限制
 * 网络总是被禁用，这里没有开关
 */
struct sandbox_limits {
    /**
     * @brief 时钟时间限制，单位为秒，必须大于 0
     */
    double wall_time = 30;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_limit = 128ll << 20;

    /**
     * @brief 可以使用的 CPU 份额，表示单个核心的比例
     */
    double cpu_share = 0.5;

    /**
     * @brief 同时存在的最大进程数
     */
    std::size_t nproc = 64;

    /**
     * @brief 创建的单个文件的最大大小，单位为字节
     */
    int64_t file_limit = 16ll << 20;

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数
     */
    int64_t stream_size = 1ll << 20;
};

/**
 * @brief 检查资源限制是否合法
 * @throw sandbox_unavailable 当限制不合法时，这种限制会被隔离后端拒绝
 */
void check_limits(const sandbox_limits &limits);

}  // namespace grader
