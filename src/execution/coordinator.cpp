#include "execution/coordinator.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <cmath>
#include "harness/harness_builder.hpp"
#include "harness/result_parser.hpp"

namespace grader {
using namespace std;

execution_coordinator::execution_coordinator(const grader_config &config, grader::sandbox &box)
    : config(config), box(box), checker(config.max_source_size, config.deny_patterns, config.risks_fatal) {}

const security_gate &execution_coordinator::gate() const {
    return checker;
}

sandbox_limits execution_coordinator::limits_for(const execution_request &request) const {
    sandbox_limits limits;
    limits.wall_time = config.timeout;
    limits.memory_limit = config.memory_limit;
    limits.cpu_share = config.cpu_share;
    limits.nproc = config.nproc;
    limits.file_limit = config.file_limit;
    limits.stream_size = config.stream_size;

    if (request.timeout && isfinite(*request.timeout) && *request.timeout > 0)
        limits.wall_time = min(*request.timeout, config.timeout);
    if (request.memory_limit && *request.memory_limit > 0)
        limits.memory_limit = min(*request.memory_limit, config.memory_limit);
    return limits;
}

sandbox_task execution_coordinator::make_task(const execution_request &request) const {
    sandbox_task task;
    task.limits = limits_for(request);
    task.stdin_data = request.stdin_data;
    task.input_files[SOURCE_FILE] = request.source;

    if (request.tests) {
        task.input_files[HARNESS_FILE] = build_harness(*request.tests, request.style);
        for (auto &[name, content] : harness_support_files(request.style))
            task.input_files[name] = content;
        task.command = harness_command(request.style);
        task.collect.push_back(REPORT_FILE);
    } else {
        task.command = {"python3", SOURCE_FILE};
    }
    task.command[0] = config.python;
    return task;
}

static string join_problems(const validation_outcome &validation) {
    vector<string> problems = validation.issues;
    problems.insert(problems.end(), validation.risks.begin(), validation.risks.end());
    return "Code validation failed: " + boost::algorithm::join(problems, "; ");
}

execution_response execution_coordinator::execute(const execution_request &request, const cancellation_token *cancel) const noexcept {
    execution_response response;
    response.status = status::RECEIVED;

    try {
        response.validation = checker.validate(request.source, request.language);
        if (!response.validation.valid) {
            response.status = status::REJECTED;
            response.error = error_kind::REJECTED_BY_POLICY;
            response.error_message = join_problems(response.validation);
            LOG(INFO) << "Submission rejected: " << *response.error_message;
            return response;
        }
        response.status = status::VALIDATED;

        sandbox_task task = make_task(request);
        response.status = status::RUNNING;
        execution_result result = box.run(task, cancel);

        if (result.error == error_kind::RUNTIME_UNAVAILABLE) {
            response.status = status::ERRORED;
            response.error = result.error;
            response.error_message = result.error_message;
        } else if (result.timed_out) {
            response.status = status::TIMED_OUT;
            response.error = error_kind::TIMED_OUT;
            response.error_message = result.error_message;
        } else {
            response.status = status::COMPLETED;
            if (request.tests) {
                test_outcome outcome = parse_test_output(result, request.style);
                if (result.error == error_kind::EXECUTION_FAILED &&
                    (outcome.total == 0 || outcome.collection_errors > 0)) {
                    // 测试代码没能运行起来，比如选手代码在导入时就抛出了异常
                    response.error = error_kind::EXECUTION_FAILED;
                    if (outcome.collection_errors > 0)
                        response.error_message =
                            fmt::format("Test collection failed with {} error(s)", outcome.collection_errors);
                    else
                        response.error_message = result.error_message;
                } else if (outcome.parse_failed()) {
                    response.error = error_kind::PARSE_AMBIGUOUS;
                    response.error_message = "Unable to parse test results from output";
                }
                response.tests = move(outcome);
            } else {
                response.error = result.error;
                response.error_message = result.error_message;
            }
        }
        response.execution = move(result);
    } catch (std::exception &e) {
        LOG(ERROR) << "Execution of submission failed: " << e.what();
        response.status = status::ERRORED;
        response.error = error_kind::RUNTIME_UNAVAILABLE;
        response.error_message = string("Execution failed: ") + e.what();
    }
    return response;
}

}  // namespace grader
