#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <vector>
#include "batch/item.hpp"

namespace grader {

/**
 * @brief 将清单中的一项转换为批量评测的提交
 * 清单项的格式：
 * {
 *     "path": "alice.py",          // 或者 "code": "..."，二者必须有一个
 *     "student": "alice",          // 可选，给出 path 时默认为文件名
 *     "language": "python",        // 可选
 *     "stdin": "...",              // 可选
 *     "tests": [{"function": "add", "inputs": [1, 2], "expected": 3}],
 *     "test_code": "...",          // 可选，与 tests 二选一
 *     "test_framework": "pytest",  // 可选，pytest 或 unittest
 *     "timeout": 5,                // 可选，单位为秒
 *     "memory_limit": "64m"        // 可选
 * }
 * @param base_dir 相对路径 path 的基准目录
 * @throw config_error 当清单项不合法时
 */
batch_item parse_manifest_item(const nlohmann::json &j, std::size_t index, const std::filesystem::path &base_dir);

/**
 * @brief 读取清单文件，清单为 JSON 数组
 * @throw config_error 当文件不存在或者格式不合法时
 */
std::vector<batch_item> load_manifest(const std::filesystem::path &path);

}  // namespace grader
