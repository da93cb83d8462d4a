#pragma once

#include <gmock/gmock.h>
#include <chrono>
#include <functional>
#include <mutex>
#include "sandbox/isolation_backend.hpp"

/**
 * 测试用的隔离后端
 * fake_backend 不会真正启动进程，而是按照 behavior 直接给出执行结果，
 * 同时记录同时存活的执行单元数量，用于检查并发上限。
 * mock_backend 是 gmock 生成的后端，用于检查后端是否被调用。
 */
namespace grader {

struct fake_backend : public isolation_backend {
    /**
     * @brief 根据执行单元的输入给出执行结果，可以向 spec.scratch 中写入文件
     * 默认返回值为 0，没有输出
     */
    std::function<unit_status(const unit_spec &)> behavior;

    /**
     * @brief 执行单元的输出
     */
    std::function<unit_output(const unit_spec &)> output;

    /**
     * @brief 为真时 create 抛出 sandbox_unavailable
     */
    std::function<bool(const unit_spec &)> unavailable;

    /**
     * @brief 每个执行单元的运行时间
     */
    std::chrono::milliseconds delay{0};

    std::unique_ptr<execution_unit> create(const unit_spec &spec) override;
    unit_status wait(execution_unit &unit, const cancellation_token *cancel) override;
    unit_output capture(execution_unit &unit) override;
    void destroy(execution_unit &unit) noexcept override;

    /**
     * @brief 同时存活的执行单元数量的最大值
     */
    std::size_t peak_units() const;

    /**
     * @brief 当前存活的执行单元数量
     */
    std::size_t live_units() const;

    std::size_t created_units() const;

private:
    mutable std::mutex mtx;
    std::size_t live = 0, peak = 0, created = 0;
};

/**
 * @brief 读取工作区中的选手代码
 */
std::string submission_of(const unit_spec &spec);

struct mock_backend : public isolation_backend {
    MOCK_METHOD(std::unique_ptr<execution_unit>, create, (const unit_spec &spec), (override));
    MOCK_METHOD(unit_status, wait, (execution_unit & unit, const cancellation_token *cancel), (override));
    MOCK_METHOD(unit_output, capture, (execution_unit & unit), (override));
    MOCK_METHOD(void, destroy, (execution_unit & unit), (noexcept, override));
};

}  // namespace grader
