#include "sandbox/runguard_backend.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/runguard_meta.hpp"

namespace grader {
using namespace std;

/**
 * @brief 轮询 runguard 进程状态的间隔
 */
constexpr useconds_t POLL_INTERVAL_US = 10000;

struct runguard_backend::runguard_unit : public execution_unit {
    runguard_unit(string id, const unit_spec &spec)
        : execution_unit(move(id)),
          limits(spec.limits),
          metafile(spec.output_dir / "program.meta"),
          stdout_file(spec.output_dir / "program.out"),
          stderr_file(spec.output_dir / "program.err"),
          log_file(spec.output_dir / "runguard.log") {}

    sandbox_limits limits;
    filesystem::path metafile, stdout_file, stderr_file, log_file;
    pid_t pid = -1;
    bool reaped = false;
    int raw_status = 0;
    elapsed_time timer;
};

static int64_t to_kilobytes(int64_t bytes) {
    return (bytes + 1023) / 1024;
}

/**
 * @brief 非阻塞地回收 runguard 进程
 * reaped 和 raw_status 只在持有 mtx 时修改，close() 据此判断 pid 是否仍属于 runguard
 * @return 进程是否已经结束
 */
static bool try_reap(pid_t pid, bool &reaped, int &raw_status, mutex &mtx) {
    lock_guard<mutex> guard(mtx);
    if (reaped) return true;
    int status;
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) {
        reaped = true;
        raw_status = status;
    } else if (ret < 0 && errno == ECHILD) {
        reaped = true;
    }
    return reaped;
}

/**
 * @brief 先让 runguard 自行终止选手程序，超过 grace 秒仍未退出则杀死 runguard 的进程组
 */
static void terminate_runguard(pid_t pid, bool &reaped, int &raw_status, mutex &mtx, double grace) {
    if (try_reap(pid, reaped, raw_status, mtx)) return;

    // runguard 收到 SIGTERM 后会杀死选手程序的进程组并写入 meta 文件
    kill(pid, SIGTERM);
    elapsed_time waited;
    while (waited.seconds() < grace) {
        if (try_reap(pid, reaped, raw_status, mtx)) return;
        usleep(POLL_INTERVAL_US);
    }

    LOG(WARNING) << "runguard " << pid << " did not exit after SIGTERM, sending SIGKILL";
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);

    // WNOWAIT 只等待不回收，回收留给 try_reap 在锁内完成
    siginfo_t info;
    while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) < 0 && errno == EINTR)
        ;
    try_reap(pid, reaped, raw_status, mtx);
}

runguard_backend::runguard_backend(runguard_backend_options options)
    : options(move(options)) {}

runguard_backend::~runguard_backend() {
    close();
}

void runguard_backend::open() {
    lock_guard<mutex> guard(mtx);
    if (opened) return;

    if (options.runguard.empty() || !filesystem::is_regular_file(options.runguard))
        throw sandbox_unavailable(fmt::format("runguard not found at '{}'", options.runguard.string()));
    if (access(options.runguard.c_str(), X_OK) != 0)
        throw sandbox_unavailable(fmt::format("runguard at '{}' is not executable", options.runguard.string()));

    int ret;
    try {
        ret = call_process(options.runguard, "--version");
    } catch (std::system_error &e) {
        throw sandbox_unavailable(fmt::format("unable to run runguard: {}", e.what()));
    }
    if (ret != 0)
        throw sandbox_unavailable(fmt::format("runguard --version exited with code {}", ret));

    opened = true;
    LOG(INFO) << "isolation backend opened with runguard " << options.runguard
              << (options.isolate ? ", namespace isolation on" : ", namespace isolation off")
              << (options.use_cgroup ? ", cgroup on" : ", cgroup off");
}

void runguard_backend::close() noexcept {
    lock_guard<mutex> guard(mtx);
    if (!opened && live.empty()) return;
    opened = false;

    // 只发送信号，由等待这些执行单元的线程负责回收
    for (runguard_unit *unit : live) {
        if (!unit->reaped && unit->pid > 0) {
            LOG(WARNING) << "terminating execution unit " << unit->id << " on close";
            kill(unit->pid, SIGTERM);
        }
    }
    LOG(INFO) << "isolation backend closed";
}

bool runguard_backend::is_open() const {
    lock_guard<mutex> guard(mtx);
    return opened;
}

size_t runguard_backend::live_units() const {
    lock_guard<mutex> guard(mtx);
    return live.size();
}

vector<string> runguard_backend::build_command(const unit_spec &spec, const runguard_unit &unit) const {
    const sandbox_limits &limits = spec.limits;
    vector<string> argv;
    argv.push_back(options.runguard.string());
    argv.push_back("--wall-time");
    argv.push_back(fmt::format("{:.3f}", limits.wall_time));
    argv.push_back("--memory-limit");
    argv.push_back(to_string(to_kilobytes(limits.memory_limit)));
    argv.push_back("--cpu-share");
    argv.push_back(fmt::format("{:.3f}", limits.cpu_share));
    argv.push_back("--nproc");
    argv.push_back(to_string(limits.nproc));
    argv.push_back("--file-limit");
    argv.push_back(to_string(to_kilobytes(limits.file_limit)));
    argv.push_back("--stream-size");
    argv.push_back(to_string(to_kilobytes(limits.stream_size)));
    argv.push_back("--no-core-dumps");
    argv.push_back("--work-dir");
    argv.push_back(spec.workspace.string());
    argv.push_back("--read-only-dir");
    argv.push_back(spec.workspace.string());
    argv.push_back("--scratch-dir");
    argv.push_back(spec.scratch.string());
    if (spec.stdin_file) {
        argv.push_back("--standard-input-file");
        argv.push_back(spec.stdin_file->string());
    }
    argv.push_back("--standard-output-file");
    argv.push_back(unit.stdout_file.string());
    argv.push_back("--standard-error-file");
    argv.push_back(unit.stderr_file.string());
    argv.push_back("--out-meta");
    argv.push_back(unit.metafile.string());
    for (auto &env : spec.env) {
        argv.push_back("--variable");
        argv.push_back(env);
    }
    if (options.isolate) argv.push_back("--isolate");
    if (!options.use_cgroup) argv.push_back("--no-cgroup");
    if (options.run_user) {
        argv.push_back("--user");
        argv.push_back(*options.run_user);
    }
    if (options.run_group) {
        argv.push_back("--group");
        argv.push_back(*options.run_group);
    }
    argv.push_back("--");
    argv.insert(argv.end(), spec.command.begin(), spec.command.end());
    return argv;
}

unique_ptr<execution_unit> runguard_backend::create(const unit_spec &spec) {
    if (spec.command.empty())
        throw sandbox_unavailable("Empty command");
    check_limits(spec.limits);

    static thread_local boost::uuids::random_generator uuid_generator;
    auto unit = make_unique<runguard_unit>(boost::uuids::to_string(uuid_generator()), spec);
    auto argv = build_command(spec, *unit);

    lock_guard<mutex> guard(mtx);
    if (!opened)
        throw sandbox_unavailable("Isolation backend is not open");

    try {
        unit->pid = spawn_program(argv, unit->log_file);
    } catch (std::system_error &e) {
        throw sandbox_unavailable(fmt::format("Unable to start execution unit: {}", e.what()));
    }
    unit->timer = elapsed_time();
    live.insert(unit.get());
    DLOG(INFO) << "execution unit " << unit->id << " started as runguard " << unit->pid;
    return unit;
}

unit_status runguard_backend::wait(execution_unit &base, const cancellation_token *cancel) {
    auto &unit = dynamic_cast<runguard_unit &>(base);
    unit_status result;

    // runguard 自己会在 wall_time 时杀死选手程序，这里是 runguard 挂起时的保底
    const double deadline = unit.limits.wall_time + options.grace_period;
    bool watchdog_fired = false, cancelled = false;

    while (!try_reap(unit.pid, unit.reaped, unit.raw_status, mtx)) {
        if (cancel && cancel->cancelled()) {
            LOG(INFO) << "execution unit " << unit.id << " cancelled";
            cancelled = true;
            terminate_runguard(unit.pid, unit.reaped, unit.raw_status, mtx, options.grace_period);
            break;
        }
        if (unit.timer.seconds() > deadline) {
            LOG(WARNING) << "runguard for execution unit " << unit.id << " overran its wall time, killing it";
            watchdog_fired = true;
            terminate_runguard(unit.pid, unit.reaped, unit.raw_status, mtx, options.grace_period);
            break;
        }
        usleep(POLL_INTERVAL_US);
    }

    result.wall_time = unit.timer.seconds();
    runguard_result meta = read_runguard_result(unit.metafile);
    result.memory_used = meta.memory;

    if (cancelled) {
        result.state = unit_state::CANCELLED;
    } else if (watchdog_fired) {
        result.state = unit_state::TIMED_OUT;
    } else if (!meta.internal_error.empty()) {
        result.state = unit_state::FAILED;
        result.error = "runguard: " + meta.internal_error;
    } else if (!meta.complete) {
        int code = WIFEXITED(unit.raw_status) ? WEXITSTATUS(unit.raw_status) : -1;
        result.state = unit_state::FAILED;
        result.error = fmt::format("runguard exited with code {} without reporting results: {}",
                                   code, read_file_prefix(unit.log_file, 1024));
    } else if (meta.time_result == "hard-timelimit") {
        result.state = unit_state::TIMED_OUT;
    } else {
        result.state = unit_state::EXITED;
        result.exit_code = meta.exitcode;
        result.signal = meta.signal;
    }

    if (result.state == unit_state::FAILED)
        LOG(ERROR) << "execution unit " << unit.id << " failed: " << result.error;
    return result;
}

unit_output runguard_backend::capture(execution_unit &base) {
    auto &unit = dynamic_cast<runguard_unit &>(base);
    unit_output output;
    output.stdout_data = read_file_prefix(unit.stdout_file, unit.limits.stream_size);
    output.stderr_data = read_file_prefix(unit.stderr_file, unit.limits.stream_size);
    return output;
}

void runguard_backend::destroy(execution_unit &base) noexcept {
    auto *unit = dynamic_cast<runguard_unit *>(&base);
    if (!unit) return;

    if (unit->pid > 0)
        terminate_runguard(unit->pid, unit->reaped, unit->raw_status, mtx, 0.5);

    lock_guard<mutex> guard(mtx);
    if (live.erase(unit))
        DLOG(INFO) << "execution unit " << unit->id << " destroyed";
}

}  // namespace grader
