#pragma once

#include <sys/types.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 将外部命令的一个参数转换为字符串
 */
inline std::string command_arg(const std::string &arg) { return arg; }
inline std::string command_arg(const char *arg) { return arg; }
inline std::string command_arg(const std::filesystem::path &arg) { return arg.string(); }

template <typename T>
std::string command_arg(const T &arg) {
    return boost::lexical_cast<std::string>(arg);
}

/**
 * @brief 执行外部命令并等待其结束
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::vector<std::string> &argv);

/**
 * @brief 关闭当前进程中 0、1、2 以外的所有文件描述符，在 fork 之后、exec 之前调用
 */
void close_inherited_fds();

/**
 * @brief 启动外部命令但不等待其结束
 * 子进程会被放入独立的进程组，调用方可以通过 kill(-pid, sig) 终止整个进程树。
 * 子进程只继承 stdin、stdout、stderr。
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param log_file 子进程的 stdout 和 stderr 重定向到这个文件，为空时继承父进程
 * @return 子进程的 pid
 * @throw std::system_error 当 fork 失败时
 */
pid_t spawn_program(const std::vector<std::string> &argv, const std::filesystem::path &log_file = {});

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path runguard("/usr/local/bin/runguard");
 *     int exitcode = call_process(runguard, "--version");
 * @endcode
 */
template <typename... Args>
int call_process(const Args &... args) {
    std::vector<std::string> argv{command_arg(args)...};
    DLOG(INFO) << boost::algorithm::join(argv, " ");
    return exec_program(argv);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 计时器，从构造开始计算经过的时钟时间
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的秒数
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
