#pragma once

#include <map>
#include <string>
#include <vector>
#include "harness/test_case.hpp"

namespace grader {

/**
 * @brief 选手代码在工作区中的文件名，测试代码通过 from solution import * 引用
 */
constexpr const char *SOURCE_FILE = "solution.py";

/**
 * @brief 测试代码在工作区中的文件名
 */
constexpr const char *HARNESS_FILE = "test_code.py";

/**
 * @brief 结构化测试报告在 scratch 中的文件名
 */
constexpr const char *REPORT_FILE = "report.json";

/**
 * @brief 生成测试代码
 * 原样的测试代码直接返回；测试用例列表按顺序生成，第 i 个（从 0 开始）用例命名为 test_case_{i+1}
 */
std::string build_harness(const test_spec &spec, test_style style);

/**
 * @brief 与测试代码放在一起的报告插件
 * pytest 使用 conftest.py 插件，unittest 使用 grader_report.py 运行器，二者都把结构化报告写入 $SCRATCH_DIR/report.json
 * @return 文件名到文件内容
 */
std::map<std::string, std::string> harness_support_files(test_style style);

/**
 * @brief 运行测试代码的命令，argv[0] 为 python3，调用方可以替换为配置的解释器
 */
std::vector<std::string> harness_command(test_style style);

}  // namespace grader
