#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 静态分析的结果
 */
struct analysis_result {
    bool success = false;

    /**
     * @brief 给人看的问题描述
     */
    std::vector<std::string> issues;

    /**
     * @brief 度量名到取值
     */
    std::map<std::string, double> metrics;
};

void to_json(nlohmann::json &j, const analysis_result &result);

/**
 * @brief 代码静态分析器
 * 分析器只读取代码，不会执行代码。更复杂的分析器（风格检查、相似度检测等）作为外部组件接入。
 */
struct analyzer {
    virtual ~analyzer();

    /**
     * @brief 分析器的名字，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 分析代码，实现需要保证可以被多个 worker 并发调用
     * @param source 选手代码
     * @param language 语言名，不区分大小写
     */
    virtual analysis_result analyze(const std::string &source, const std::string &language) const = 0;
};

/**
 * @brief 统计代码行数的分析器
 * 度量包括 lines_of_code、blank_lines、comment_lines、function_count、class_count，
 * 超过 max_line_length 的行会产生一个问题。
 */
struct line_metrics_analyzer : public analyzer {
    explicit line_metrics_analyzer(std::size_t max_line_length = 120);

    std::string name() const override;

    analysis_result analyze(const std::string &source, const std::string &language) const override;

private:
    std::size_t max_line_length;
};

}  // namespace grader
