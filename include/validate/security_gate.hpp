#pragma once

#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <vector>

namespace grader {

enum class pattern_kind {
    /**
     * @brief 匹配 import m、import a, m、import m.x、from m import ...、from m.x import ...
     */
    IMPORT,

    /**
     * @brief 源代码中出现该子串
     */
    SUBSTRING,

    /**
     * @brief ECMAScript 正则表达式
     */
    REGEX
};

/**
 * @brief 一条拒绝规则，命中时产生一个风险标记
 */
struct deny_pattern {
    /**
     * @brief 给人看的说明，作为风险标记的内容
     */
    std::string label;

    std::string pattern;

    pattern_kind kind = pattern_kind::SUBSTRING;
};

void from_json(const nlohmann::json &j, deny_pattern &pattern);

/**
 * @brief 保守的默认拒绝规则
 * 包括进程和系统相关模块、网络、序列化和存储、文件访问、动态执行、全局命名空间反射
 */
std::vector<deny_pattern> default_deny_patterns();

struct validation_outcome {
    /**
     * @brief issues 为空，且在 risks_fatal 时 risks 也为空
     */
    bool valid = false;

    /**
     * @brief 必然导致拒绝的问题，比如代码过大、语法错误、语言不支持
     */
    std::vector<std::string> issues;

    /**
     * @brief 命中拒绝规则产生的风险标记
     */
    std::vector<std::string> risks;
};

void to_json(nlohmann::json &j, const validation_outcome &outcome);

/**
 * @brief 静态的预检查
 * 只是尽力而为的提示性检查，很容易被绕过，真正的安全边界是隔离后端。
 * 语法检查通过内嵌的 CPython 解释器只编译不执行，需要解释器已经初始化。
 */
class security_gate {
public:
    /**
     * @param max_source_size 代码的最大字节数
     * @param patterns 拒绝规则
     * @param risks_fatal 为真时任何风险标记都导致拒绝
     * @throw config_error 当正则表达式不合法时
     */
    security_gate(std::size_t max_source_size, std::vector<deny_pattern> patterns, bool risks_fatal);

    /**
     * @brief 检查代码，不会抛出异常，结果不会只包含一部分检查
     * @param language 语言名，不区分大小写，目前只支持 python
     */
    validation_outcome validate(const std::string &source, const std::string &language) const noexcept;

private:
    void check_python(const std::string &source, validation_outcome &outcome) const;

    std::size_t max_source_size;
    std::vector<deny_pattern> patterns;
    std::vector<std::regex> regexes;
    bool risks_fatal;
};

/**
 * @brief 判断源代码是否导入了指定模块
 * @param module 模块名，如 "os" 或 "os.path"
 */
bool imports_module(const std::string &source, const std::string &module);

/**
 * @brief 通过 CPython 编译（不执行）代码，检查语法
 * @return 语法错误的描述，如 "invalid syntax (line 3)"，没有错误时为空
 * @throw internal_error 当解释器没有初始化时
 */
std::string python_syntax_error(const std::string &source);

}  // namespace grader
