#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/times.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include "cgroup.hpp"
#include "limits.hpp"
#include "runguard_options.hpp"

using namespace std;

static const struct timespec kill_delay = {0, 100000000L};  // 0.1s
static const int BUF_SIZE = 4096;

static const int TIMELIMIT_SOFT = 1;
static const int TIMELIMIT_HARD = 2;
static int wall_exceeded = 0, cpu_exceeded = 0;

static ofstream metafile;
static pid_t child_pid = -1;
static volatile sig_atomic_t child_exited = 0;
static volatile sig_atomic_t received_signal = -1;

template <typename... Args>
static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

template <typename T>
static void append_meta(const char *key, T message) {
    if (metafile) metafile << key << ": " << message << endl;
}

/**
 * @brief 将子进程的 stdout、stderr 经管道转发到输出文件
 * 超过 stream_size 的部分只统计字节数，不再写入
 */
struct stream_relay {
    int read_end[3] = {-1, -1, -1};
    int write_end[3] = {-1, -1, -1};
    int target[3] = {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO};
    size_t read_bytes[3] = {0, 0, 0};
    size_t passed_bytes[3] = {0, 0, 0};
    int64_t limit = -1;
    bool use_splice = true;

    void open_pipes() {
        for (int i = 1; i <= 2; i++) {
            int fds[2];
            if (pipe(fds) != 0) error(errno, "creating pipe for fd {}", i);
            read_end[i] = fds[0];
            write_end[i] = fds[1];
        }
    }

    /**
     * @brief 子进程中调用：把管道写端接到 1、2 号描述符上
     */
    void attach_child() {
        for (int i = 1; i <= 2; i++) {
            if (dup2(write_end[i], i) < 0) error(errno, "redirecting child fd {}", i);
            if (close(write_end[i]) != 0 || close(read_end[i]) != 0)
                error(errno, "closing pipe for fd {}", i);
        }
    }

    /**
     * @brief 父进程中调用：关闭写端并打开输出文件，stdout 与 stderr 可以是同一个文件
     */
    void open_targets(const runguard_options &opt) {
        for (int i = 1; i <= 2; i++) {
            if (close(write_end[i]) != 0) error(errno, "closing pipe for fd {}", i);
            write_end[i] = -1;
        }
        limit = opt.stream_size;

        if (!opt.stdout_filename.empty()) {
            target[STDOUT_FILENO] = creat(opt.stdout_filename.c_str(), S_IRUSR | S_IWUSR);
            if (target[STDOUT_FILENO] < 0) error(errno, "opening file '{}'", opt.stdout_filename);
        }
        if (!opt.stderr_filename.empty()) {
            if (opt.stderr_filename == opt.stdout_filename) {
                target[STDERR_FILENO] = target[STDOUT_FILENO];
            } else {
                target[STDERR_FILENO] = creat(opt.stderr_filename.c_str(), S_IRUSR | S_IWUSR);
                if (target[STDERR_FILENO] < 0) error(errno, "opening file '{}'", opt.stderr_filename);
            }
        }
    }

    bool active() const {
        return read_end[1] >= 0 || read_end[2] >= 0;
    }

    /**
     * @brief 将仍然打开的读端加入 fds
     * @return pselect 的 nfds 参数
     */
    int watch(fd_set *fds) const {
        FD_ZERO(fds);
        int nfds = -1;
        for (int i = 1; i <= 2; i++) {
            if (read_end[i] < 0) continue;
            FD_SET(read_end[i], fds);
            nfds = max(nfds, read_end[i]);
        }
        return nfds + 1;
    }

    void pump(fd_set *fds) {
        char buf[BUF_SIZE];
        for (int i = 1; i <= 2; i++) {
            if (read_end[i] < 0 || !FD_ISSET(read_end[i], fds)) continue;

            ssize_t n;
            size_t room = limit < 0 ? BUF_SIZE : min<size_t>(BUF_SIZE, (size_t)limit - passed_bytes[i]);
            if (room == 0) {
                // 已达到输出上限，丢弃数据但仍然统计读取量
                n = read(read_end[i], buf, BUF_SIZE);
            } else {
                n = transfer(i, buf, room);
                if (n > 0) {
                    passed_bytes[i] += n;
                    if (limit >= 0 && passed_bytes[i] == (size_t)limit)
                        LOG(INFO) << "child fd " << i << " limit reached";
                }
            }

            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                error(errno, "copying data fd {}", i);
            }
            if (n == 0) {
                if (close(read_end[i]) != 0) error(errno, "closing pipe for fd {}", i);
                read_end[i] = -1;
                continue;
            }
            read_bytes[i] += n;
        }
    }

    /**
     * @brief 子进程退出后，以阻塞方式读完管道中剩余的数据
     */
    void drain() {
        for (int i = 1; i <= 2; i++) {
            if (read_end[i] < 0) continue;
            int flags = fcntl(read_end[i], F_GETFL);
            if (flags == -1) error(errno, "fcntl, getting flags");
            if (fcntl(read_end[i], F_SETFL, flags & ~O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
        }

        fd_set fds;
        size_t before;
        do {
            before = read_bytes[1] + read_bytes[2];
            watch(&fds);
            pump(&fds);
        } while (active() && read_bytes[1] + read_bytes[2] > before);
    }

    void close_targets() {
        if (target[STDOUT_FILENO] != STDOUT_FILENO && close(target[STDOUT_FILENO]) != 0)
            error(errno, "closing output fd {}", STDOUT_FILENO);
        if (target[STDERR_FILENO] != STDERR_FILENO && target[STDERR_FILENO] != target[STDOUT_FILENO] &&
            close(target[STDERR_FILENO]) != 0)
            error(errno, "closing output fd {}", STDERR_FILENO);
    }

private:
    // 优先使用 splice 在管道和文件之间搬运数据，内核不支持时退回到 read/write
    ssize_t transfer(int i, char *buf, size_t room) {
        if (use_splice) {
            ssize_t n = splice(read_end[i], NULL, target[i], NULL, room, SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
            if (n == -1 && errno == EINVAL) {
                use_splice = false;
                LOG(ERROR) << "splice failed, switching to read/write";
                errno = EAGAIN;
            }
            return n;
        }

        ssize_t n = read(read_end[i], buf, room);
        for (ssize_t written = 0; n > 0 && written < n;) {
            ssize_t w = write(target[i], buf + written, n - written);
            if (w == -1) return -1;
            written += w;
        }
        return n;
    }
};

/**
 * @brief 未捕获异常时调用：写入 internal-error，杀死子进程组后退出
 */
static void runguard_terminate_handler() {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    try {
        if (exception_ptr cur = current_exception()) rethrow_exception(cur);
    } catch (const exception &e) {
        cerr << e.what() << endl;
        append_meta("internal-error", e.what());
    } catch (...) {
        cerr << "Unknown exception occurred" << endl;
        append_meta("internal-error", "unknown exception");
    }

    if (child_pid > 0) {
        LOG(INFO) << "sending SIGKILL";
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill children while terminating: " << strerror(errno);
        nanosleep(&kill_delay, nullptr);
    }

    exit(EXIT_FAILURE);
}

/**
 * @brief SIGALRM（硬墙钟时间到）或 SIGTERM：先 SIGTERM 后 SIGKILL 整个进程组
 */
static void on_terminate_signal(int sig) {
    struct sigaction sigact;
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    if (sigemptyset(&sigact.sa_mask) != 0 ||
        sigaction(SIGTERM, &sigact, NULL) != 0 ||
        sigaction(SIGALRM, &sigact, NULL) != 0)
        LOG(WARNING) << "could not restore signal handlers";

    if (sig == SIGALRM) {
        wall_exceeded |= TIMELIMIT_HARD;
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
    } else {
        LOG(WARNING) << "received signal " << sig << ": aborting command";
    }
    received_signal = sig;

    // 已经退出的进程不算错误
    for (int s : {SIGTERM, SIGKILL}) {
        LOG(INFO) << "sending " << strsignal(s);
        if (kill(-child_pid, s) != 0 && errno != ESRCH)
            error(errno, "sending signal {} to command", s);
        nanosleep(&kill_delay, NULL);
    }
}

static void on_child_exit(int /* signal */) {
    child_exited = 1;
}

/**
 * @brief 屏蔽 SIGCHLD 并安装处理函数，子进程退出由 pselect 的临时掩码放行
 */
static void install_sigchld_handler() {
    sigset_t sigmask;
    if (sigemptyset(&sigmask) != 0 || sigaddset(&sigmask, SIGCHLD) != 0)
        error(errno, "setting signal mask");
    if (sigprocmask(SIG_SETMASK, &sigmask, NULL) != 0)
        error(errno, "masking SIGCHLD");

    struct sigaction sigact;
    child_exited = 0;
    sigact.sa_handler = on_child_exit;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    if (sigaction(SIGCHLD, &sigact, NULL) != 0)
        error(errno, "installing signal handler");
}

/**
 * @brief SIGTERM 与 SIGALRM 共用 on_terminate_signal，只触发一次
 * 开启墙钟限制时设置 hard 秒后到期的 ITIMER_REAL
 */
static void install_watchdog(const runguard_options &opt) {
    struct sigaction sigact;
    sigemptyset(&sigact.sa_mask);
    if (sigaddset(&sigact.sa_mask, SIGALRM) != 0 || sigaddset(&sigact.sa_mask, SIGTERM) != 0)
        error(errno, "setting signal mask");
    sigact.sa_handler = on_terminate_signal;
    sigact.sa_flags = SA_RESETHAND | SA_RESTART;

    if (sigaction(SIGTERM, &sigact, NULL) != 0)
        error(errno, "installing signal handler");
    if (!opt.use_wall_limit) return;

    if (sigaction(SIGALRM, &sigact, NULL) != 0)
        error(errno, "installing signal handler");

    double whole;
    struct itimerval itimer = {};
    itimer.it_value.tv_sec = (time_t)opt.wall_limit.hard;
    itimer.it_value.tv_usec = (suseconds_t)(modf(opt.wall_limit.hard, &whole) * 1E6);
    if (setitimer(ITIMER_REAL, &itimer, NULL) != 0)
        error(errno, "setting timer");
    LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
}

/**
 * @brief 重置 OOM 分值
 * oom_score_adj 会被子进程继承，某些 sshd 会将其设为负值，
 * 导致内存超限时被当作超时处理
 */
static void reset_oom_score() {
    for (const char *path : {"/proc/self/oom_score_adj", "/proc/self/oom_adj"}) {
        fstream file(path, ios::in | ios::out);
        if (!file) continue;

        int value;
        if (!(file >> value)) error(errno, "cannot read from '{}'", path);
        if (value < 0) {
            LOG(INFO) << "resetting '" << path << "' from " << value << " to 0";
            file.clear();
            file.seekp(0);
            if (!(file << 0 << endl)) error(errno, "cannot write to '{}'", path);
        }
        return;
    }
}

/**
 * @brief 从 cgroup 中读取内存峰值和 CPU 时间，然后清理 cgroup
 * @return CPU 时间，单位为秒
 */
static double summarize_cgroup(const runguard_options &opt) {
    cgroup_unit cg(opt.cgroupname);
    cg.load();

    int64_t max_usage = cg.read_int64("memory", "memory.max_usage_in_bytes");
    LOG(INFO) << "total memory used: " << max_usage / 1024 << "kB";
    append_meta("memory-bytes", to_string(max_usage));

    // cpuacct.usage 单位为纳秒
    double cpu_time = (double)cg.read_int64("cpuacct", "cpuacct.usage") / 1e9;

    // memory.oom_control 形如 "oom_kill_disable 0\nunder_oom 0\noom_kill 1"
    bool is_oom = false;
    istringstream fin(cg.read_string("memory", "memory.oom_control"));
    string token;
    while (fin >> token) {
        if (token == "oom_kill") {
            int count = 0;
            fin >> count;
            is_oom = count > 0;
        }
    }
    append_meta("memory-result", is_oom ? "oom" : "");

    // 确保选手程序派生的子进程不会比被监控的进程活得更久
    cgroup_kill(opt);
    cgroup_delete(opt);

    return cpu_time;
}

/**
 * @brief 没有 cgroup 时通过 getrusage 读取已回收子进程的峰值常驻内存
 */
static void summarize_rusage() {
    struct rusage usage;
    if (getrusage(RUSAGE_CHILDREN, &usage) != 0)
        error(errno, "getrusage");
    LOG(INFO) << "peak resident memory: " << usage.ru_maxrss << "kB";
    append_meta("memory-bytes", to_string((int64_t)usage.ru_maxrss * 1024));
}

struct clock_sample {
    struct timeval wall;
    struct tms ticks;

    static clock_sample now() {
        clock_sample sample;
        if (gettimeofday(&sample.wall, NULL) != 0) error(errno, "getting time");
        if (times(&sample.ticks) == (clock_t)-1) error(errno, "getting clock ticks");
        return sample;
    }
};

static void summarize(const runguard_options &opt, int exitcode,
                      const clock_sample &start, const clock_sample &end,
                      const stream_relay &relay) {
    static const char *time_result[] = {"", "soft-timelimit", "hard-timelimit", "hard-timelimit"};

    double tps = (double)sysconf(_SC_CLK_TCK);
    double wall_time = (end.wall.tv_sec - start.wall.tv_sec) + (end.wall.tv_usec - start.wall.tv_usec) * 1E-6;
    double user_time = (end.ticks.tms_cutime - start.ticks.tms_cutime) / tps;
    double sys_time = (end.ticks.tms_cstime - start.ticks.tms_cstime) / tps;
    double cpu_time;

    if (opt.use_cgroup) {
        cpu_time = summarize_cgroup(opt);
    } else {
        summarize_rusage();
        cpu_time = user_time + sys_time;
    }

    append_meta("exitcode", exitcode);
    if (received_signal != -1) append_meta("signal", received_signal);

    append_meta("wall-time", fmt::format("{:.3f}", wall_time));
    append_meta("user-time", fmt::format("{:.3f}", user_time));
    append_meta("sys-time", fmt::format("{:.3f}", sys_time));
    append_meta("cpu-time", fmt::format("{:.3f}", cpu_time));
    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", wall_time, user_time, sys_time);

    if (opt.use_wall_limit && wall_time > opt.wall_limit.soft) {
        wall_exceeded |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }
    if (opt.use_cpu_limit && cpu_time > opt.cpu_limit.soft) {
        cpu_exceeded |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }
    append_meta("time-result", time_result[wall_exceeded | cpu_exceeded]);

    if (opt.stream_size >= 0) {
        using namespace boost::assign;
        vector<string> truncated;
        if (relay.passed_bytes[STDOUT_FILENO] < relay.read_bytes[STDOUT_FILENO]) truncated += "stdout";
        if (relay.passed_bytes[STDERR_FILENO] < relay.read_bytes[STDERR_FILENO]) truncated += "stderr";
        append_meta("output-truncated", boost::algorithm::join(truncated, ","));
    }

    append_meta("stdin-bytes", relay.read_bytes[STDIN_FILENO]);
    append_meta("stdout-bytes", relay.read_bytes[STDOUT_FILENO]);
    append_meta("stderr-bytes", relay.read_bytes[STDERR_FILENO]);
}

/**
 * @brief 将 waitpid 的状态转换为退出码，因信号终止时为 128 + 信号
 */
static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);

    if (WIFSIGNALED(status)) {
        received_signal = WTERMSIG(status);
        if (received_signal == SIGXCPU) {
            cpu_exceeded |= TIMELIMIT_HARD;
            LOG(WARNING) << "Time Limit Exceeded (hard limit)";
        } else {
            LOG(WARNING) << "Command terminated with signal (" << received_signal << ", " << strsignal(received_signal) << ")";
        }
        return received_signal + 128;
    }

    if (WIFSTOPPED(status)) {
        received_signal = WSTOPSIG(status);
        LOG(WARNING) << "Command stopped with signal (" << received_signal << ", " << strsignal(received_signal) << ")";
        return received_signal + 128;
    }

    throw runtime_error(fmt::format("unknown status: {:x}", status));
}

/**
 * @brief 关闭 0、1、2 以外的描述符，包括 meta 文件和 grader 遗留下来的描述符
 */
static void close_inherited_fds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
    struct rlimit lim;
    int max_fd = getrlimit(RLIMIT_NOFILE, &lim) == 0 && lim.rlim_cur != RLIM_INFINITY ? (int)lim.rlim_cur : 65536;
    for (int fd = 3; fd < max_fd; ++fd) close(fd);
}

/**
 * @brief 子进程：重定向标准流，施加限制后 exec 受控程序，不会返回
 */
static void exec_command(runguard_options &opt, stream_relay &relay) {
    if (!opt.stdin_filename.empty()) {
        if (!freopen(opt.stdin_filename.c_str(), "r", stdin))
            error(errno, "unable to open stdin file {}", opt.stdin_filename);
    } else {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0)
            error(errno, "redirecting stdin to /dev/null");
        close(devnull);
    }

    set_restrictions(opt);
    relay.attach_child();
    close_inherited_fds();

    // 过滤器必须最后设置
    set_seccomp(opt);

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(arg.data());
    args.push_back(nullptr);

    execvp(args[0], args.data());
    error(errno, "unable to start command {}", opt.command[0]);
}

/**
 * @brief 父进程：转发输出直到子进程退出，然后统计资源使用
 * @return 子进程的退出码
 */
static int watch_command(const runguard_options &opt, stream_relay &relay) {
    // 子进程与 runguard 同一用户时不再需要 root 权限来杀死子进程
    if (opt.user_id < 0 && setuid(getuid()) != 0)
        error(errno, "setting watchdog uid");

    clock_sample start = clock_sample::now();
    relay.open_targets(opt);
    if (!opt.stdin_filename.empty()) {
        struct stat st;
        if (stat(opt.stdin_filename.c_str(), &st) == 0) relay.read_bytes[STDIN_FILENO] = st.st_size;
    }

    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");
    install_watchdog(opt);

    int status = 0;
    fd_set fds;
    while (true) {
        int nfds = relay.watch(&fds);
        int r = pselect(nfds, &fds, NULL, NULL, NULL, &emptymask);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        if (child_exited || received_signal == SIGALRM) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0) error(errno, "waiting on child");
            if (pid == child_pid) break;
            child_exited = 0;
        }

        if (r > 0) relay.pump(&fds);
    }

    // 残留进程持有的管道写端会让 drain 一直阻塞
    kill(-child_pid, SIGKILL);
    relay.drain();
    relay.close_targets();

    clock_sample end = clock_sample::now();
    int exitcode = decode_status(status);

    if (setuid(getuid()) != 0)
        error(errno, "dropping root privileges");

    summarize(opt, exitcode, start, end, relay);
    return exitcode;
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    if (!opt.metafile_path.empty())
        metafile.open(opt.metafile_path.c_str(), ofstream::out);

    stream_relay relay;
    relay.open_pipes();
    install_sigchld_handler();

    if (opt.use_cgroup) {
        cgroup_unit::init();
        opt.cgroupname = fmt::format("/grader/cgroup_{}_{}", getpid(), (int)time(NULL));
        cgroup_create(opt);
    } else {
        LOG(INFO) << "cgroup disabled, falling back to rlimit";
    }

    /*
     * 分离命名空间：
     * CLONE_FILES、CLONE_FS：不再与父进程共享描述符表和文件系统信息
     * CLONE_NEWIPC、CLONE_SYSVSEM：受控程序无法与主机程序进行进程间通信
     * CLONE_NEWNET：新命名空间里只有未启用的回环设备
     * CLONE_NEWNS：工作区在其中被重新挂载为只读
     * CLONE_NEWUTS：隔离 hostname
     */
    if (opt.isolate) {
        if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
            error(errno, "unable to unshare namespaces");
        setup_mounts(opt);
    }

    reset_oom_score();

    child_pid = fork();
    if (child_pid < 0)
        error(errno, "unable to fork");
    if (child_pid == 0) {
        exec_command(opt, relay);
        throw runtime_error("exec returned");
    }
    return watch_command(opt, relay);
}
