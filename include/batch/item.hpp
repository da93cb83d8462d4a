#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "analyzer/analyzer.hpp"
#include "execution/request.hpp"

namespace grader {

/**
 * @brief 批量评测中的一个提交
 */
struct batch_item {
    /**
     * @brief 提交在批次中的下标
     */
    std::size_t index = 0;

    /**
     * @brief 学生标识，仅用于报告
     */
    std::optional<std::string> student;

    execution_request request;
};

/**
 * @brief 一个提交的评测结果
 */
struct item_result {
    std::size_t index = 0;

    std::optional<std::string> student;

    /**
     * @brief 执行是否完成，测试没有全部通过也算完成
     */
    bool success = false;

    /**
     * @brief 测试通过率，百分制，没有测试时为空
     */
    std::optional<double> score;

    grader::status status = grader::status::ERRORED;

    std::optional<std::string> error_message;

    std::optional<execution_response> response;

    std::optional<analysis_result> analysis;

    /**
     * @brief 处理这个提交花费的时钟时间，单位为秒
     */
    double processing_time = 0;
};

void to_json(nlohmann::json &j, const item_result &result);

/**
 * @brief 构造一个失败的结果，用于处理过程抛出异常或者批次被取消的提交
 */
item_result failed_item(const batch_item &item, const std::string &message);

}  // namespace grader
