#include "batch/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

item_processor::~item_processor() {}

grading_pipeline::grading_pipeline(const execution_coordinator &coordinator, const analyzer *code_analyzer)
    : coordinator(coordinator), code_analyzer(code_analyzer) {}

item_result grading_pipeline::process(const batch_item &item, const cancellation_token &cancel) {
    item_result result;
    result.index = item.index;
    result.student = item.student;

    if (code_analyzer) {
        try {
            result.analysis = code_analyzer->analyze(item.request.source, item.request.language);
        } catch (std::exception &ex) {
            // 分析失败不影响执行
            LOG(WARNING) << "Analyzer " << code_analyzer->name() << " failed on item " << item.index << ": " << ex.what();
        }
    }

    execution_response response = coordinator.execute(item.request, &cancel);
    result.status = response.status;
    result.success = response.status == status::COMPLETED;
    if (response.tests) result.score = response.tests->pass_rate();
    if (!result.success) result.error_message = response.error_message.value_or(get_display_message(response.status));
    result.response = move(response);
    return result;
}

const char *score_grade(double score) {
    if (score >= 90) return "A (90-100)";
    else if (score >= 80) return "B (80-89)";
    else if (score >= 70) return "C (70-79)";
    else if (score >= 60) return "D (60-69)";
    else return "F (0-59)";
}

void to_json(json &j, const batch_outcome &outcome) {
    j = {{"success", outcome.success},
         {"total_files", outcome.total},
         {"processed_files", outcome.processed},
         {"failed_files", outcome.failed},
         {"processing_time", outcome.processing_time},
         {"average_time", outcome.average_time},
         {"errors", outcome.errors},
         {"results", outcome.results}};
    j["average_score"] = outcome.average_score ? json(*outcome.average_score) : json();
    j["score_distribution"] = outcome.score_distribution.empty() ? json() : json(outcome.score_distribution);
}

batch_orchestrator::batch_orchestrator(item_processor &processor, size_t max_batch_size)
    : processor(processor), max_batch_size(max_batch_size) {}

void batch_orchestrator::cancel() noexcept {
    token.cancel();
}

bool batch_orchestrator::cancelled() const noexcept {
    return token.cancelled();
}

void batch_orchestrator::run_item(const batch_item &item, item_result &result) {
    if (token.cancelled()) {
        result = failed_item(item, "Batch cancelled");
        return;
    }

    elapsed_time timer;
    try {
        result = processor.process(item, token);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Processing of item " << item.index << " has crashed, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        result = failed_item(item, string("Processing failed: ") + ex.what());
    } catch (...) {
        LOG(ERROR) << "Processing of item " << item.index << " has crashed with an unknown exception";
        result = failed_item(item, "Processing failed: unknown error");
    }
    if (!is_terminal(result.status)) {
        LOG(ERROR) << "Item " << item.index << " finished in state " << get_display_message(result.status);
        result = failed_item(item, fmt::format("Processing finished in non-terminal state {}", get_display_message(result.status)));
    }
    result.index = item.index;
    result.processing_time = timer.seconds();
}

void batch_orchestrator::worker_loop(size_t worker_id, concurrent_queue<size_t> &task_queue,
                                     const vector<batch_item> &items, vector<item_result> &results) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    size_t index;
    // 所有任务在 worker 启动前已经入队，队列为空即可退出
    while (task_queue.try_pop(index))
        run_item(items[index], results[index]);

    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

batch_outcome batch_orchestrator::process_batch(const vector<batch_item> &items, size_t concurrency, bool sequential) {
    if (items.size() > max_batch_size)
        throw config_error(fmt::format("Batch of {} items exceeds the maximum batch size {}", items.size(), max_batch_size));
    if (!sequential && concurrency == 0)
        throw config_error("Concurrency should be at least 1");

    batch_outcome outcome;
    outcome.total = items.size();
    outcome.results.resize(items.size());

    LOG(INFO) << "Starting batch of " << items.size() << " items"
              << (sequential ? " sequentially" : fmt::format(" with {} workers", min(concurrency, items.size())));

    elapsed_time timer;
    if (sequential) {
        for (size_t i = 0; i < items.size(); ++i)
            run_item(items[i], outcome.results[i]);
    } else {
        concurrent_queue<size_t> task_queue;
        for (size_t i = 0; i < items.size(); ++i)
            task_queue.push(i);

        vector<thread> workers;
        size_t worker_count = min(concurrency, items.size());
        for (size_t i = 0; i < worker_count; ++i)
            workers.emplace_back([this, i, &task_queue, &items, &outcome] {
                worker_loop(i, task_queue, items, outcome.results);
            });
        for (auto &worker : workers)
            worker.join();
    }
    outcome.processing_time = timer.seconds();

    double score_sum = 0, time_sum = 0;
    size_t scored = 0;
    for (size_t i = 0; i < outcome.results.size(); ++i) {
        item_result &result = outcome.results[i];
        result.index = items[i].index;
        time_sum += result.processing_time;
        if (result.success) {
            ++outcome.processed;
        } else {
            ++outcome.failed;
            if (result.error_message) outcome.errors.push_back(*result.error_message);
        }
        if (result.score) {
            score_sum += *result.score;
            ++scored;
            ++outcome.score_distribution[score_grade(*result.score)];
        }
    }
    outcome.success = outcome.failed == 0;
    if (!items.empty()) outcome.average_time = time_sum / items.size();
    if (scored > 0) outcome.average_score = score_sum / scored;

    LOG(INFO) << "Batch completed: " << outcome.processed << " processed, " << outcome.failed << " failed in "
              << outcome.processing_time << "s";
    return outcome;
}

}  // namespace grader
