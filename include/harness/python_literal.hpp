#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 将字符串转义为单引号包围的 Python 字符串字面量
 * 反斜杠、单引号、\n、\r、\t 使用对应的转义，其他控制字符使用 \xNN
 */
std::string python_string(const std::string &text);

/**
 * @brief 将 JSON 值转换为可以被 Python 重新解析的字面量
 * null、布尔、整数、浮点数（最短往返表示，inf 和 nan 使用 float(...)）、字符串、列表、字典
 */
std::string python_literal(const nlohmann::json &value);

}  // namespace grader
