#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief runguard 写入 meta 文件的运行信息
 * meta 文件每行形如 "key: value"
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    std::optional<int> signal;

    /**
     * @brief runguard 自身出错时的错误信息，为空表示 runguard 正常工作
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节），runguard 没有报告时为空
     */
    std::optional<int64_t> memory;

    /**
     * @brief 为 "hard-timelimit" 时表示程序因超时被杀死
     */
    std::string time_result;

    /**
     * @brief meta 文件是否存在且包含 exitcode
     */
    bool complete = false;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace grader
