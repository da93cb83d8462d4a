#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>

namespace grader {
using namespace std;

static vector<char *> make_argv(const vector<string> &argv) {
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    return args;
}

void close_inherited_fds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
    // 内核不支持 close_range 时逐个关闭
    struct rlimit lim;
    int max_fd = getrlimit(RLIMIT_NOFILE, &lim) == 0 && lim.rlim_cur != RLIM_INFINITY ? (int)lim.rlim_cur : 65536;
    for (int fd = 3; fd < max_fd; ++fd) close(fd);
}

int exec_program(const vector<string> &argv) {
    if (argv.empty()) throw invalid_argument("empty command");
    auto args = make_argv(argv);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            close_inherited_fds();
            execvp(args[0], args.data());
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

pid_t spawn_program(const vector<string> &argv, const filesystem::path &log_file) {
    if (argv.empty()) throw invalid_argument("empty command");
    auto args = make_argv(argv);

    pid_t pid;
    switch (pid = fork()) {
        case -1:
            throw system_error(errno, system_category(), "fork");
        case 0:
            signal(SIGINT, SIG_IGN);
            // 独立的进程组，方便 destroy 时一次性杀死整个进程树
            setpgid(0, 0);
            if (!log_file.empty()) {
                int fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
                if (fd < 0) _exit(126);
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
            // 其他 worker 此时可能正打开着别的提交的工作区文件
            close_inherited_fds();
            execvp(args[0], args.data());
            _exit(127);
        default:
            // 父进程也设置一次，避免子进程 setpgid 之前父进程就发送了信号
            setpgid(pid, pid);
            return pid;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace grader
