#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 超时时 exit_code 的取值，与任何真实的返回值都不同
 */
constexpr int TIMEOUT_EXIT_CODE = -1;

/**
 * @brief 沙箱执行一次程序的结果
 * 沙箱不会抛出异常，所有错误都以字段的形式返回
 */
struct execution_result {
    /**
     * @brief 程序正常退出且返回值为 0
     */
    bool success = false;

    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 程序返回值，因信号终止时为 128 + 信号，超时为 TIMEOUT_EXIT_CODE
     */
    int exit_code = TIMEOUT_EXIT_CODE;

    /**
     * @brief 时钟时间，单位为秒
     */
    double execution_time = 0;

    /**
     * @brief 内存峰值（单位为字节），仅在隔离后端报告了内存使用时存在
     */
    std::optional<int64_t> memory_used;

    bool timed_out = false;

    std::optional<std::string> error_message;

    error_kind error = error_kind::NONE;

    /**
     * @brief 从 scratch 目录收集回来的文件，文件名到文件内容
     */
    std::map<std::string, std::string> artifacts;
};

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace grader
