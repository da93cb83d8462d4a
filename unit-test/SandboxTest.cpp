#include <sys/wait.h>
#include <unistd.h>
#include <fstream>
#include <future>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/runguard_backend.hpp"
#include "sandbox/sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = test_run_dir() / ("sandbox-" + to_string(getpid()));
        filesystem::create_directories(run_dir);

        runguard_backend_options options;
        options.runguard = GRADER_RUNGUARD;
        options.use_cgroup = false;
        backend = make_unique<runguard_backend>(options);
        backend->open();
        box = make_unique<sandbox>(*backend, run_dir);
    }

    void TearDown() override {
        box.reset();
        backend->close();
        backend.reset();
        filesystem::remove_all(run_dir);
    }

    static sandbox_task shell(const string &script) {
        sandbox_task task;
        task.command = {"/bin/sh", "-c", script};
        task.limits.wall_time = 5;
        return task;
    }

    filesystem::path run_dir;
    unique_ptr<runguard_backend> backend;
    unique_ptr<sandbox> box;
};

TEST_F(SandboxTest, InputFilesAndStdinTest) {
    sandbox_task task = shell("cat input.txt; cat");
    task.input_files["input.txt"] = "hello ";
    task.stdin_data = "world";

    execution_result result = box->run(task);
    EXPECT_TRUE(result.success) << result.error_message.value_or("") << result.stderr_data;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "hello world");
    EXPECT_EQ(result.error, error_kind::NONE);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(SandboxTest, NonZeroExitTest) {
    execution_result result = box->run(shell("echo oops >&2; exit 3"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_data, "oops\n");
    EXPECT_EQ(result.error, error_kind::EXECUTION_FAILED);
    EXPECT_EQ(result.error_message.value_or(""), "Process exited with code 3");
}

TEST_F(SandboxTest, InfiniteLoopTimeoutTest) {
    sandbox_task task = shell("while :; do :; done");
    task.limits.wall_time = 2;

    execution_result result = box->run(task);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, TIMEOUT_EXIT_CODE);
    EXPECT_EQ(result.error, error_kind::TIMED_OUT);
    EXPECT_EQ(result.stderr_data, "Execution timed out");
    EXPECT_EQ(result.error_message.value_or(""), "Code execution exceeded 2s timeout");
    EXPECT_GE(result.execution_time, 1.9);
    EXPECT_LT(result.execution_time, 5);
    EXPECT_EQ(backend->live_units(), 0);
}

TEST_F(SandboxTest, CancelTest) {
    cancellation_token cancel;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        cancel.cancel();
    });

    sandbox_task task = shell("sleep 30");
    execution_result result = box->run(task, &cancel);
    canceller.join();

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error_message.value_or(""), "Execution cancelled");
    EXPECT_LT(result.execution_time, 5);
    EXPECT_EQ(backend->live_units(), 0);
}

TEST_F(SandboxTest, ScratchArtifactTest) {
    sandbox_task task = shell("echo '{}' > \"$SCRATCH_DIR/report.json\"");
    task.collect = {"report.json", "missing.json"};

    execution_result result = box->run(task);
    EXPECT_TRUE(result.success) << result.stderr_data;
    ASSERT_EQ(result.artifacts.count("report.json"), 1);
    EXPECT_EQ(result.artifacts["report.json"], "{}\n");
    EXPECT_EQ(result.artifacts.count("missing.json"), 0);
}

TEST_F(SandboxTest, WorkspaceIsRemovedTest) {
    box->run(shell("true"));
    box->run(shell("exit 1"));
    EXPECT_TRUE(filesystem::is_empty(run_dir));
}

TEST_F(SandboxTest, UnsafeInputFileTest) {
    sandbox_task task = shell("true");
    task.input_files["../escape.py"] = "x = 1";

    execution_result result = box->run(task);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::RUNTIME_UNAVAILABLE);
    EXPECT_FALSE(filesystem::exists(run_dir / "escape.py"));
}

TEST_F(SandboxTest, ClosedBackendTest) {
    backend->close();
    execution_result result = box->run(shell("true"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.error, error_kind::RUNTIME_UNAVAILABLE);
    EXPECT_EQ(backend->live_units(), 0);
}

TEST_F(SandboxTest, CloseWhileRunningTest) {
    vector<future<execution_result>> runs;
    for (int i = 0; i < 4; ++i)
        runs.push_back(async(launch::async, [&, i] { return box->run(shell(i % 2 ? "sleep 30" : "true")); }));

    // 与回收线程并发地反复 close，只会向仍在运行的 runguard 发送信号
    this_thread::sleep_for(chrono::milliseconds(300));
    for (int i = 0; i < 20; ++i) {
        backend->close();
        this_thread::sleep_for(chrono::milliseconds(5));
    }

    for (auto &run : runs) {
        execution_result result = run.get();
        EXPECT_LT(result.execution_time, 5);
    }
    EXPECT_EQ(backend->live_units(), 0);
    EXPECT_FALSE(backend->is_open());
}

TEST_F(SandboxTest, InvalidLimitsTest) {
    sandbox_task task = shell("true");
    task.limits.wall_time = -1;
    execution_result result = box->run(task);
    EXPECT_EQ(result.error, error_kind::RUNTIME_UNAVAILABLE);
}

// 只用 shell 内建命令检查 shell 自身打开的 3 号及以上描述符，避免管道和 opendir 自己占用描述符
static const char *OPEN_FDS_SCRIPT =
    "for fd in $(seq 3 1023); do [ -e /proc/$$/fd/$fd ] && echo $fd; done; true";

/**
 * @brief 在另一个线程中打开一个文件并保持打开，直到析构
 */
struct open_file_holder {
    explicit open_file_holder(const filesystem::path &path) {
        promise<void> opened;
        auto ready = opened.get_future();
        holder = thread([this, path, &opened] {
            ofstream fout(path.string());
            fout << "secret = 1\n" << flush;
            opened.set_value();
            released.get_future().wait();
        });
        ready.wait();
    }

    ~open_file_holder() {
        released.set_value();
        holder.join();
    }

    promise<void> released;
    thread holder;
};

TEST_F(SandboxTest, NoInheritedDescriptorTest) {
    open_file_holder other(run_dir / "other_student_solution.py");

    execution_result result = box->run(shell("ls -l /proc/$$/fd"));
    ASSERT_TRUE(result.success) << result.stderr_data;
    EXPECT_EQ(result.stdout_data.find("other_student_solution.py"), string::npos) << result.stdout_data;
    EXPECT_EQ(result.stdout_data.find("meta"), string::npos) << result.stdout_data;

    execution_result listing = box->run(shell(OPEN_FDS_SCRIPT));
    ASSERT_TRUE(listing.success) << listing.stderr_data;
    EXPECT_EQ(listing.stdout_data, "");
}

TEST(ProcessTest, SpawnProgramClosesInheritedFdsTest) {
    filesystem::path dir = test_run_dir() / ("spawn-" + to_string(getpid()));
    filesystem::create_directories(dir);
    {
        open_file_holder other(dir / "other_student_solution.py");

        pid_t pid = spawn_program({"/bin/sh", "-c", OPEN_FDS_SCRIPT}, dir / "fds.log");
        int status = 0;
        ASSERT_EQ(waitpid(pid, &status, 0), pid);
        ASSERT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }
    EXPECT_EQ(read_file_content(dir / "fds.log"), "");
    filesystem::remove_all(dir);
}

TEST(RunguardBackendTest, MissingRunguardTest) {
    runguard_backend_options options;
    options.runguard = "/nonexistent/runguard";
    runguard_backend backend(options);
    EXPECT_THROW(backend.open(), sandbox_unavailable);
    EXPECT_FALSE(backend.is_open());
}
