#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用，或者 fork 出一个新进程再调用本函数
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 若启用 cgroup，创建 cgroup，并注册 cpu、cpuacct、memory 资源管控器，限制 CPU 份额、内存使用
 * 3. 若启用隔离，分离 FILES、FS、IPC、NET、NS、UTS、SYSVSEM 等命名空间，并将工作区重新挂载为只读
 * 4. 调用 fork 创建子进程，并等待子进程结束
 *    1. 对于父进程
 *       1. 创建 itimer 来限制 wall time，在遇到 SIGALRM 时终止整个进程组并记录信息到 meta 文件中
 *       2. 与子进程建立管道连接，按 stream_size 截断后重定向到文件
 *       3. 等待子进程结束
 *    2. 对于子进程
 *       1. 必要时清除环境变量
 *       2. 通过 rlimit 限制 CPU time、文件大小、进程数，没有 cgroup 时通过 RLIMIT_AS 限制内存
 *       3. 将子进程挂载到我们创建的 cgroup 上
 *       4. 设置 chroot 和工作路径
 *       5. 设置子进程的 user 和 group，或者清空 root 的能力集
 *       6. 设置 no_new_privs 和 seccomp 过滤器
 * 5. 检查子进程是否正常退出，因信号终止时返回值为 128 + 信号
 * 6. 读取 cgroup 或者 getrusage 的监测数据，得到运行时间、内存使用
 * 7. 杀死 cgroup 内的所有进程确保选手 fork 出来的子进程都不会留驻系统
 * 8. 删除创建的 cgroup，并记录所有的信息到 meta 文件中
 */
int runit(struct runguard_options opt);
