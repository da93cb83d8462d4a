#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

struct cgroup;
struct cgroup_controller;

/**
 * @brief libcgroup 调用失败时抛出，错误信息包含调用名与 libcgroup 的错误描述
 */
struct cgroup_error : public std::runtime_error {
    cgroup_error(const std::string &op, int err);
};

/**
 * @brief 检查 libcgroup 的返回值，非零时抛出 cgroup_error
 */
void check_cgroup(const std::string &op, int err);

/**
 * @brief 一个受控程序独占的 cgroup（v1 层级）
 *
 * 用到的 controller：
 * 1. memory - 限制内存上限（RAM 与 RAM+交换 相同以禁止交换），统计内存峰值和 OOM 次数
 * 2. cpu - 通过 cfs_quota_us / cfs_period_us 限制 CPU 份额
 * 3. cpuacct - 统计 CPU 时间
 * 4. cpuset - 可选，绑定到指定 CPU
 *
 * 对象本身只持有 libcgroup 的描述结构，析构时释放；
 * 内核中的 cgroup 需要显式 create/remove。
 */
class cgroup_unit {
public:
    explicit cgroup_unit(const std::string &name);
    cgroup_unit(const cgroup_unit &) = delete;
    cgroup_unit &operator=(const cgroup_unit &) = delete;
    ~cgroup_unit();

    /**
     * @brief 登记一个参数，在 create 时写入内核。controller 不存在时自动添加
     */
    void set(const std::string &controller, const std::string &param, int64_t value);
    void set(const std::string &controller, const std::string &param, const std::string &value);

    /**
     * @brief 仅登记 controller，不设参数
     */
    void enable(const std::string &controller);

    /**
     * @brief 读取内核中的参数值，调用前需要 load
     */
    int64_t read_int64(const std::string &controller, const std::string &param);

    /**
     * @brief 读取多行参数，如 memory.oom_control
     */
    std::string read_string(const std::string &controller, const std::string &param);

    void create();
    void load();

    /**
     * @brief 将当前进程移入本 cgroup
     */
    void attach();

    /**
     * @brief 删除内核中的 cgroup，残留进程移回上层
     */
    void remove();

    static void init();

private:
    struct cgroup_controller *controller(const std::string &name, bool create);

    std::string name;
    struct cgroup *cg;
};
