#include "limits.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <grp.h>
#include <libcgroup.h>
#include <linux/capability.h>
#include <signal.h>
#include <math.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <system_error>
#include "cgroup.hpp"
#include <seccomp.h>

using namespace std;

const int64_t CFS_PERIOD_US = 100000;

void cgroup_create(const struct runguard_options &opt) {
    cgroup_unit cg(opt.cgroupname);

    int64_t memory_limit = opt.memory_limit;
    if (memory_limit < 0) memory_limit = RLIM_INFINITY;

    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
    cg.set("memory", "memory.limit_in_bytes", memory_limit);
    cg.set("memory", "memory.memsw.limit_in_bytes", memory_limit);

    if (!opt.cpuset.empty()) {
        cg.set("cpuset", "cpuset.mems", "0");
        cg.set("cpuset", "cpuset.cpus", opt.cpuset);
    }

    // CPU 份额通过 CFS 带宽控制实现：每个周期内最多运行 quota 微秒
    if (opt.cpu_share > 0) {
        cg.set("cpu", "cpu.cfs_period_us", CFS_PERIOD_US);
        cg.set("cpu", "cpu.cfs_quota_us", max<int64_t>(1000, (int64_t)(opt.cpu_share * CFS_PERIOD_US)));
    }

    cg.enable("cpuacct");
    cg.create();
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_unit cg(opt.cgroupname);
    cg.load();
    cg.attach();
}

void cgroup_kill(const struct runguard_options &opt) {
    void *handle = nullptr;
    pid_t pid;

    // 每次重新枚举，直到 cgroup 中不再有进程
    while (true) {
        int ret = cgroup_get_task_begin(opt.cgroupname.c_str(), "memory", &handle, &pid);
        if (handle) cgroup_get_task_end(&handle);
        if (ret != 0) break;
        kill(pid, SIGKILL);
    }
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_unit cg(opt.cgroupname);
    cg.enable("cpuacct");
    cg.enable("memory");
    if (!opt.cpuset.empty()) cg.enable("cpuset");
    if (opt.cpu_share > 0) cg.enable("cpu");
    cg.remove();
}

void setup_mounts(const struct runguard_options &opt) {
    // 避免挂载事件传播回宿主机的 mount 命名空间
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
        throw system_error(errno, generic_category(), "unable to make mounts private");

    if (!opt.read_only_dir.empty()) {
        const char *dir = opt.read_only_dir.c_str();
        if (mount(dir, dir, nullptr, MS_BIND | MS_REC, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to bind {}", opt.read_only_dir));
        if (mount(dir, dir, nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to remount {} read-only", opt.read_only_dir));
        LOG(INFO) << "mounted " << opt.read_only_dir << " read-only";
    }

    if (!opt.scratch_dir.empty()) {
        const char *dir = opt.scratch_dir.c_str();
        if (mount(dir, dir, nullptr, MS_BIND, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to bind {}", opt.scratch_dir));
        if (mount(dir, dir, nullptr, MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NODEV, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to remount {}", opt.scratch_dir));
    }
}

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

/**
 * @brief 清空 root 进程的能力集
 * 包括 bounding set，否则 execve 之后 uid 0 会重新获得全部能力
 */
static void drop_capabilities() {
    for (int cap = 0; cap <= CAP_LAST_CAP; ++cap) {
        if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL)
            throw system_error(errno, generic_category(), fmt::format("unable to drop capability {}", cap));
    }

    struct __user_cap_header_struct header = {_LINUX_CAPABILITY_VERSION_3, 0};
    struct __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3] = {};
    if (syscall(SYS_capset, &header, data) != 0)
        throw system_error(errno, generic_category(), "unable to clear capabilities");
}

void set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        environ[0] = nullptr;
        if (path) setenv("PATH", path, true);
    }

    for (auto &entry : opt.env) {
        std::string env = entry;
        auto idx = env.find('=');
        setenv(env.substr(0, idx).c_str(), env.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    if (opt.use_cgroup || opt.memory_limit < 0) {
        // memory limits(RLIMIT_AS, RLIMIT_DATA) are handled by cgroups
        set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
        set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);
    } else {
        // 没有 cgroup 时只能限制虚拟地址空间
        set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit);
    }

    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc > 0 && opt.nproc != numeric_limits<size_t>::max()) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    if (opt.use_cgroup) cgroup_attach(opt);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1 && getpgrp() != getpid())
        throw system_error(errno, generic_category(), "unable to setsid");

    // set root directory and change working directory
    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");

        LOG(INFO) << "chrooted to directory " << opt.chroot_dir;
    }

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[10];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
        if (geteuid() == 0 || getuid() == 0)
            throw runtime_error("you cannot run user command as root");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
        if (geteuid() == 0) {
            LOG(WARNING) << "no user specified, running command as root without capabilities";
            drop_capabilities();
        }
    }
}

static void deny(scmp_filter_ctx ctx, int syscall_nr) {
    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall_nr, 0);
    if (rc < 0)
        throw system_error(-rc, generic_category(), fmt::format("seccomp_rule_add({})", syscall_nr));
}

void set_seccomp(const struct runguard_options &) {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0)
        throw system_error(errno, generic_category(), "unable to set no_new_privs");

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw runtime_error("seccomp_init failed");

    try {
        // 只允许进程内的 unix 套接字，网络一律拒绝
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_NE, AF_UNIX));
        if (rc < 0) throw system_error(-rc, generic_category(), "seccomp_rule_add(socket)");

        deny(ctx, SCMP_SYS(ptrace));
        deny(ctx, SCMP_SYS(process_vm_readv));
        deny(ctx, SCMP_SYS(process_vm_writev));
        deny(ctx, SCMP_SYS(mount));
        deny(ctx, SCMP_SYS(umount2));
        deny(ctx, SCMP_SYS(pivot_root));
        deny(ctx, SCMP_SYS(chroot));
        deny(ctx, SCMP_SYS(unshare));
        deny(ctx, SCMP_SYS(setns));
        deny(ctx, SCMP_SYS(reboot));
        deny(ctx, SCMP_SYS(kexec_load));
        deny(ctx, SCMP_SYS(init_module));
        deny(ctx, SCMP_SYS(finit_module));
        deny(ctx, SCMP_SYS(delete_module));
        deny(ctx, SCMP_SYS(swapon));
        deny(ctx, SCMP_SYS(swapoff));
        deny(ctx, SCMP_SYS(sethostname));
        deny(ctx, SCMP_SYS(setdomainname));
        deny(ctx, SCMP_SYS(bpf));
        deny(ctx, SCMP_SYS(perf_event_open));

        rc = seccomp_load(ctx);
        if (rc < 0) throw system_error(-rc, generic_category(), "seccomp_load");
    } catch (...) {
        seccomp_release(ctx);
        throw;
    }
    seccomp_release(ctx);
}
