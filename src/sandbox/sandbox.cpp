#include "sandbox/sandbox.hpp"
#include <string.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/workspace.hpp"

namespace grader {
using namespace std;

sandbox::sandbox(isolation_backend &backend, filesystem::path run_dir, bool keep_workspaces)
    : isolation(backend), run_dir(move(run_dir)), keep_workspaces(keep_workspaces) {}

isolation_backend &sandbox::backend() const {
    return isolation;
}

static void fill_timeout(execution_result &result, const sandbox_limits &limits, bool cancelled) {
    result.success = false;
    result.timed_out = true;
    result.exit_code = TIMEOUT_EXIT_CODE;
    result.stderr_data = "Execution timed out";
    result.error = error_kind::TIMED_OUT;
    if (cancelled)
        result.error_message = "Execution cancelled";
    else
        result.error_message = fmt::format("Code execution exceeded {}s timeout", limits.wall_time);
}

static void fill_exit(execution_result &result, const unit_status &status) {
    result.exit_code = status.exit_code;
    result.success = status.exit_code == 0;
    if (result.success) return;

    result.error = error_kind::EXECUTION_FAILED;
    if (status.signal)
        result.error_message = fmt::format("Process terminated by signal {} ({})", *status.signal, strsignal(*status.signal));
    else
        result.error_message = fmt::format("Process exited with code {}", status.exit_code);
}

execution_result sandbox::run(const sandbox_task &task, const cancellation_token *cancel) noexcept {
    execution_result result;
    try {
        workspace ws(run_dir, keep_workspaces);
        for (auto &[name, content] : task.input_files)
            ws.write_file(name, content);

        unit_spec spec;
        spec.command = task.command;
        spec.workspace = ws.files();
        spec.scratch = ws.scratch();
        spec.output_dir = ws.root();
        spec.limits = task.limits;
        if (task.stdin_data) {
            spec.stdin_file = ws.root() / "stdin.txt";
            write_file_content(*spec.stdin_file, *task.stdin_data);
        }

        // 工作区是只读的，临时文件只能写到 scratch
        spec.env = {"PYTHONDONTWRITEBYTECODE=1",
                    "PYTHONUNBUFFERED=1",
                    "HOME=" + ws.scratch().string(),
                    "TMPDIR=" + ws.scratch().string(),
                    string(SCRATCH_ENV) + "=" + ws.scratch().string()};
        spec.env.insert(spec.env.end(), task.env.begin(), task.env.end());

        unique_ptr<execution_unit> unit = isolation.create(spec);
        defer { isolation.destroy(*unit); };

        unit_status status = isolation.wait(*unit, cancel);
        result.execution_time = status.wall_time;
        result.memory_used = status.memory_used;

        unit_output output = isolation.capture(*unit);
        result.stdout_data = move(output.stdout_data);
        result.stderr_data = move(output.stderr_data);

        switch (status.state) {
            case unit_state::EXITED:
                fill_exit(result, status);
                break;
            case unit_state::TIMED_OUT:
                fill_timeout(result, task.limits, false);
                break;
            case unit_state::CANCELLED:
                fill_timeout(result, task.limits, true);
                break;
            case unit_state::FAILED:
                result.success = false;
                result.error = error_kind::RUNTIME_UNAVAILABLE;
                result.error_message = status.error;
                break;
        }

        for (auto &name : task.collect) {
            filesystem::path artifact = ws.scratch() / assert_safe_path(name);
            if (filesystem::is_regular_file(artifact))
                result.artifacts[name] = read_file_content(artifact);
        }
    } catch (sandbox_unavailable &e) {
        LOG(ERROR) << "sandbox unavailable: " << e.what();
        result.success = false;
        result.error = error_kind::RUNTIME_UNAVAILABLE;
        result.error_message = e.what();
    } catch (std::exception &e) {
        LOG(ERROR) << "sandbox internal error: " << e.what();
        result.success = false;
        result.error = error_kind::RUNTIME_UNAVAILABLE;
        result.error_message = fmt::format("Sandbox internal error: {}", e.what());
    }
    return result;
}

}  // namespace grader
