#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "harness/result_parser.hpp"
#include "harness/test_case.hpp"
#include "sandbox/execution_result.hpp"
#include "validate/security_gate.hpp"

namespace grader {

/**
 * @brief 一次执行请求
 */
struct execution_request {
    /**
     * @brief 选手代码
     */
    std::string source;

    /**
     * @brief 语言名，不区分大小写
     */
    std::string language = "python";

    /**
     * @brief 作为标准输入传给选手程序的内容
     */
    std::optional<std::string> stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒，超过配置的上限时按上限处理
     */
    std::optional<double> timeout;

    /**
     * @brief 内存限制，单位为字节，超过配置的上限时按上限处理
     */
    std::optional<int64_t> memory_limit;

    /**
     * @brief 测试说明，为空时直接运行选手代码
     */
    std::optional<test_spec> tests;

    test_style style = test_style::PYTEST;
};

/**
 * @brief 一次执行请求的结果
 * 每个请求恰好产生一个结果
 */
struct execution_response {
    /**
     * @brief 终止状态
     */
    grader::status status = grader::status::RECEIVED;

    error_kind error = error_kind::NONE;

    validation_outcome validation;

    /**
     * @brief 沙箱的执行结果，被拒绝时为空
     */
    std::optional<execution_result> execution;

    /**
     * @brief 测试结果，只在请求带有测试说明并且执行完成时存在
     */
    std::optional<test_outcome> tests;

    std::optional<std::string> error_message;
};

void to_json(nlohmann::json &j, const execution_response &response);

}  // namespace grader
