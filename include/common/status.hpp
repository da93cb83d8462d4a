#pragma once

namespace grader {

/**
 * @brief 表示一次执行请求的生命周期状态
 * RECEIVED -> VALIDATED -> REJECTED
 * RECEIVED -> VALIDATED -> RUNNING -> TIMED_OUT / COMPLETED / ERRORED
 */
enum class status {
    /**
     * @brief 请求已接收，还未经过安全检查
     */
    RECEIVED = 0,

    /**
     * @brief 请求通过了安全检查
     */
    VALIDATED = 1,

    /**
     * @brief 执行单元正在运行
     */
    RUNNING = 2,

    /**
     * @brief 被安全检查拒绝，沙箱没有被调用（终止状态）
     */
    REJECTED = 3,

    /**
     * @brief 执行超出时钟时间限制，执行单元已被强制终止（终止状态）
     */
    TIMED_OUT = 4,

    /**
     * @brief 执行完成（终止状态）
     * 选手程序可能返回了非零值，或者测试没有全部通过，这些信息在结果里
     */
    COMPLETED = 5,

    /**
     * @brief 运行时本身出错，比如隔离后端不可用（终止状态）
     */
    ERRORED = 6
};

/**
 * @brief 错误分类
 * 用来区分选手代码的问题和评测系统本身的问题
 */
enum class error_kind {
    NONE = 0,

    /**
     * @brief 代码被安全检查拒绝
     */
    REJECTED_BY_POLICY = 1,

    /**
     * @brief 执行超时
     */
    TIMED_OUT = 2,

    /**
     * @brief 隔离后端不可用、创建执行单元失败或者资源限制被拒绝
     */
    RUNTIME_UNAVAILABLE = 3,

    /**
     * @brief 选手程序返回了非零值或者因为信号崩溃
     */
    EXECUTION_FAILED = 4,

    /**
     * @brief 程序产生了输出，但无法从中解析出测试结果
     */
    PARSE_AMBIGUOUS = 5
};

const char *get_display_message(status);

const char *get_display_message(error_kind);

/**
 * @brief 状态是否为终止状态
 */
bool is_terminal(status);

}  // namespace grader
