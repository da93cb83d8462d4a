#pragma once

#include "runguard_options.hpp"

/**
 * @brief 按照内存、CPU 份额和 cpuset 设置创建 cgroup
 */
void cgroup_create(const struct runguard_options &);

/**
 * @brief 将当前进程移入 cgroup，在子进程 exec 之前调用
 */
void cgroup_attach(const struct runguard_options &);

/**
 * @brief 杀死 cgroup 中残留的所有进程
 */
void cgroup_kill(const struct runguard_options &);

void cgroup_delete(const struct runguard_options &);

/**
 * @brief 在新的 mount 命名空间里准备文件系统视图
 * read_only_dir 被重新挂载为只读，scratch_dir 保持可写。
 * 必须在 unshare(CLONE_NEWNS) 之后调用
 */
void setup_mounts(const struct runguard_options &opt);

/**
 * @brief 在子进程中设置 rlimit、chroot、工作目录与用户身份
 */
void set_restrictions(const struct runguard_options &opt);

/**
 * @brief 限制系统调用
 * 默认允许，对网络套接字（AF_UNIX 除外）、ptrace、mount 等特权调用返回 EPERM。
 * 调用前会设置 PR_SET_NO_NEW_PRIVS
 */
void set_seccomp(const struct runguard_options &opt);
