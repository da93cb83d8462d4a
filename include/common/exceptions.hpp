#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是工作目录、外部程序等本身的问题，与选手代码无关
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示隔离后端不可用
 * 比如 runguard 不存在、后端已经关闭、创建执行单元失败或资源限制被拒绝。
 * 这类错误与选手程序自身的失败要区分开来
 */
struct sandbox_unavailable : public grader_exception {
    sandbox_unavailable();
    explicit sandbox_unavailable(const std::string &message);
};

/**
 * @brief 表示配置错误，在任何评测任务开始之前抛出
 */
struct config_error : public grader_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace grader
