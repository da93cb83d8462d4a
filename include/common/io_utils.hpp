#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * @param limit 最多读取的字节数
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit);

/**
 * @brief 将 content 写入文件，文件存在时覆盖
 * @throw std::system_error 当文件无法打开时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，输入文件的文件名
 * 来自外部请求，如果包含 "../" 或者是绝对路径，那么最后有可能
 * 写到工作区之外的地方。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
