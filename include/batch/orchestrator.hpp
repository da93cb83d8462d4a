#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "batch/item.hpp"
#include "common/concurrent_queue.hpp"
#include "execution/coordinator.hpp"
#include "sandbox/cancellation.hpp"

namespace grader {

/**
 * @brief 处理批次中单个提交的流程
 */
struct item_processor {
    virtual ~item_processor();

    /**
     * @brief 处理一个提交，会被多个 worker 并发调用
     * 抛出的异常会被 worker 捕获并转换为这个提交的失败结果
     * @param cancel 批次的取消标志
     */
    virtual item_result process(const batch_item &item, const cancellation_token &cancel) = 0;
};

/**
 * @brief 默认的提交处理流程
 * 先运行分析器（如果有），再通过 coordinator 执行代码，通过率作为分数。
 */
class grading_pipeline : public item_processor {
public:
    /**
     * @param coordinator 生命周期必须长于 pipeline
     * @param code_analyzer 可以为空
     */
    explicit grading_pipeline(const execution_coordinator &coordinator, const analyzer *code_analyzer = nullptr);

    item_result process(const batch_item &item, const cancellation_token &cancel) override;

private:
    const execution_coordinator &coordinator;
    const analyzer *code_analyzer;
};

/**
 * @brief 批次的汇总结果
 */
struct batch_outcome {
    /**
     * @brief results[i] 对应第 i 个提交
     */
    std::vector<item_result> results;

    std::size_t total = 0;

    /**
     * @brief 成功的提交数
     */
    std::size_t processed = 0;

    std::size_t failed = 0;

    /**
     * @brief 没有失败的提交
     */
    bool success = false;

    /**
     * @brief 整个批次花费的时钟时间，单位为秒
     */
    double processing_time = 0;

    double average_time = 0;

    /**
     * @brief 带有分数的提交的平均分，没有分数时为空
     */
    std::optional<double> average_score;

    /**
     * @brief 分数段到提交数，如 "A (90-100)"
     */
    std::map<std::string, std::size_t> score_distribution;

    /**
     * @brief 失败提交的错误信息
     */
    std::vector<std::string> errors;
};

void to_json(nlohmann::json &j, const batch_outcome &outcome);

/**
 * @brief 分数所在的分数段
 */
const char *score_grade(double score);

/**
 * @brief 批量评测
 * 并行模式下启动 min(concurrency, n) 个 worker 线程，worker 从并发队列中拉取提交的下标进行评测，
 * 因此同时运行的执行单元不会超过 concurrency 个。结果按下标存放，与输入顺序一致。
 */
class batch_orchestrator {
public:
    /**
     * @param processor 生命周期必须长于 orchestrator
     * @param max_batch_size 一批最多包含的提交数
     */
    batch_orchestrator(item_processor &processor, std::size_t max_batch_size);

    /**
     * @brief 评测一批提交，等待所有提交处理结束后返回
     * 单个提交的失败不会影响其他提交，也不会使这个函数抛出异常
     * @param concurrency 并行模式下同时评测的最大提交数
     * @param sequential 为真时在调用线程中逐个评测
     * @throw config_error 当提交数超过上限，或者 concurrency 为 0 时
     */
    batch_outcome process_batch(const std::vector<batch_item> &items, std::size_t concurrency, bool sequential);

    /**
     * @brief 取消批次
     * 正在运行的执行单元会被销毁，还没有开始的提交记为失败。
     * 取消是永久的，之后的批次也会被取消。
     */
    void cancel() noexcept;

    bool cancelled() const noexcept;

private:
    void run_item(const batch_item &item, item_result &result);

    /**
     * @brief worker 线程的主循环，队列为空时退出
     */
    void worker_loop(std::size_t worker_id, concurrent_queue<std::size_t> &task_queue,
                     const std::vector<batch_item> &items, std::vector<item_result> &results);

    item_processor &processor;
    std::size_t max_batch_size;
    cancellation_token token;
};

}  // namespace grader
