#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "harness/test_case.hpp"
#include "sandbox/execution_result.hpp"

namespace grader {

/**
 * @brief 测试结果的来源
 */
enum class parse_source {
    /**
     * @brief 来自报告插件写入的 report.json
     */
    STRUCTURED,

    /**
     * @brief 来自 pytest 或 unittest 的文本输出
     */
    TEXT,

    /**
     * @brief 无法解析出任何测试结果
     */
    NONE
};

struct failed_test {
    std::string name;
    std::string message;
    std::string output;
};

struct test_outcome {
    int total = 0;

    int passed = 0;

    std::vector<failed_test> failures;

    /**
     * @brief 收集测试时出错的数量，比如选手代码在导入时就抛出了异常
     * 此时测试根本没有运行，failures 中记录的是收集错误
     */
    int collection_errors = 0;

    /**
     * @brief 测试程序的 stdout，原样保留
     */
    std::string raw_output;

    parse_source source = parse_source::NONE;

    /**
     * @brief 没有解析出任何测试，但是测试程序产生了输出
     */
    bool parse_failed() const;

    /**
     * @brief 通过率，百分制，没有测试时为 0
     */
    double pass_rate() const;
};

void to_json(nlohmann::json &j, const test_outcome &outcome);

/**
 * @brief 从测试程序的执行结果中解析测试数量和失败信息
 * 优先使用结构化报告，报告不存在或者不合法时退回到解析 stdout，再到 stderr
 */
test_outcome parse_test_output(const execution_result &result, test_style style);

/**
 * @brief 解析 report.json
 * @return 报告是否合法（summary.total、summary.passed 为整数且 0 <= passed <= total）
 * summary.collection_errors 可选，缺省为 0
 */
bool parse_structured_report(const std::string &report, test_outcome &outcome);

/**
 * @brief 解析 pytest 的文本输出，如 "1 failed, 2 passed in 0.05s" 和 "FAILED id - message"
 * "ERROR test_code.py - ..." 这种不带 "::" 的 ERROR 行是收集错误。
 * 计数超出 int 范围的汇总行视为无法识别
 * @return 是否找到了汇总行
 */
bool parse_pytest_text(const std::string &text, test_outcome &outcome);

/**
 * @brief 解析 unittest 的文本输出，如 "Ran 3 tests" 和 "FAILED (failures=1, errors=1)"
 * 计数超出 int 范围时视为无法解析
 * @return 是否找到了 "Ran N tests"
 */
bool parse_unittest_text(const std::string &text, test_outcome &outcome);

}  // namespace grader
