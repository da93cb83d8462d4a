#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    std::string cgroupname;
    std::string chroot_dir;
    std::string work_dir;
    size_t nproc = std::numeric_limits<size_t>::max();
    int user_id = -1;
    int group_id = -1;
    std::string cpuset;  // processor id to run client program.

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int file_limit = -1;        // Output limit
    int stream_size = -1;
    bool no_core_dumps = false;

    /**
     * @brief 受控程序可使用的 CPU 份额（单核的比例），小于等于 0 表示不限制
     */
    double cpu_share = -1;

    /**
     * @brief 为假时不使用 cgroup，内存限制退化为 RLIMIT_AS，内存统计使用 getrusage
     * 用于没有 root 权限或者没有挂载 cgroup v1 的环境
     */
    bool use_cgroup = true;

    /**
     * @brief 为真时分离 IPC、NET、NS、UTS、SYSVSEM 命名空间，需要 root 权限
     */
    bool isolate = false;

    /**
     * @brief 在新的 mount 命名空间中以只读方式重新挂载的目录
     */
    std::string read_only_dir;

    /**
     * @brief 受控程序唯一可写的目录
     */
    std::string scratch_dir;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
