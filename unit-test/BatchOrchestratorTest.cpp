#include <unistd.h>
#include <functional>
#include <thread>
#include "batch/orchestrator.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"
#include "test/mock_backend.hpp"

using namespace std;
using namespace grader;

/**
 * @brief 通过回调处理提交的 item_processor
 */
struct callback_processor : public item_processor {
    function<item_result(const batch_item &, const cancellation_token &)> callback;

    item_result process(const batch_item &item, const cancellation_token &cancel) override {
        return callback(item, cancel);
    }
};

static vector<batch_item> make_items(size_t n) {
    vector<batch_item> items;
    for (size_t i = 0; i < n; ++i) {
        batch_item item;
        item.index = i;
        item.student = "student" + to_string(i);
        item.request.source = "def f():\n    return " + to_string(i) + "\n";
        items.push_back(move(item));
    }
    return items;
}

static item_result succeeded(const batch_item &item, optional<double> score = {}) {
    item_result result;
    result.index = item.index;
    result.student = item.student;
    result.success = true;
    result.status = status::COMPLETED;
    result.score = score;
    return result;
}

class BatchOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test_config();
        config.run_dir = test_run_dir() / ("batch-" + to_string(getpid()));
        filesystem::create_directories(config.run_dir);
    }

    void TearDown() override {
        filesystem::remove_all(config.run_dir);
    }

    grader_config config;
};

TEST_F(BatchOrchestratorTest, ConcurrencyLimitTest) {
    fake_backend backend;
    backend.delay = chrono::milliseconds(100);
    sandbox box(backend, config.run_dir);
    execution_coordinator coordinator(config, box);
    grading_pipeline pipeline(coordinator);
    batch_orchestrator orchestrator(pipeline, config.max_batch_size);

    auto items = make_items(10);
    batch_outcome outcome = orchestrator.process_batch(items, 3, false);

    EXPECT_EQ(backend.created_units(), 10);
    EXPECT_LE(backend.peak_units(), 3);
    EXPECT_GE(backend.peak_units(), 1);
    EXPECT_EQ(backend.live_units(), 0);
    ASSERT_EQ(outcome.results.size(), 10);
    for (size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(outcome.results[i].index, i);
        EXPECT_EQ(outcome.results[i].student, items[i].student);
        EXPECT_TRUE(outcome.results[i].success);
    }
    EXPECT_EQ(outcome.processed, 10);
    EXPECT_EQ(outcome.failed, 0);
    EXPECT_TRUE(outcome.success);
}

TEST_F(BatchOrchestratorTest, SequentialTest) {
    fake_backend backend;
    backend.delay = chrono::milliseconds(10);
    sandbox box(backend, config.run_dir);
    execution_coordinator coordinator(config, box);
    grading_pipeline pipeline(coordinator);
    batch_orchestrator orchestrator(pipeline, config.max_batch_size);

    batch_outcome outcome = orchestrator.process_batch(make_items(4), 0, true);
    EXPECT_EQ(backend.peak_units(), 1);
    EXPECT_EQ(outcome.processed, 4);
    EXPECT_TRUE(outcome.success);
}

TEST_F(BatchOrchestratorTest, RuntimeUnavailableItemTest) {
    fake_backend backend;
    backend.delay = chrono::milliseconds(20);
    backend.unavailable = [](const unit_spec &spec) {
        return submission_of(spec).find("return 2") != string::npos;
    };
    sandbox box(backend, config.run_dir);
    execution_coordinator coordinator(config, box);
    grading_pipeline pipeline(coordinator);
    batch_orchestrator orchestrator(pipeline, config.max_batch_size);

    batch_outcome outcome = orchestrator.process_batch(make_items(5), 3, false);

    ASSERT_EQ(outcome.results.size(), 5);
    EXPECT_EQ(outcome.failed, 1);
    EXPECT_EQ(outcome.processed, 4);
    EXPECT_FALSE(outcome.success);
    for (size_t i = 0; i < 5; ++i)
        EXPECT_EQ(outcome.results[i].success, i != 2) << "item " << i;
    EXPECT_EQ(outcome.results[2].status, status::ERRORED);
    ASSERT_TRUE(outcome.results[2].response);
    EXPECT_EQ(outcome.results[2].response->error, error_kind::RUNTIME_UNAVAILABLE);
    EXPECT_EQ(outcome.errors.size(), 1);
}

TEST_F(BatchOrchestratorTest, ThrowingItemIsIsolatedTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) {
        if (item.index == 3) throw internal_error("boom");
        return succeeded(item);
    };
    batch_orchestrator orchestrator(processor, 100);

    batch_outcome outcome = orchestrator.process_batch(make_items(6), 2, false);
    ASSERT_EQ(outcome.results.size(), 6);
    EXPECT_EQ(outcome.failed, 1);
    EXPECT_FALSE(outcome.results[3].success);
    EXPECT_EQ(outcome.results[3].index, 3);
    EXPECT_EQ(outcome.results[3].student, "student3");
    EXPECT_EQ(outcome.results[3].error_message.value_or(""), "Processing failed: boom");
    EXPECT_EQ(outcome.errors, vector<string>({"Processing failed: boom"}));
}

TEST_F(BatchOrchestratorTest, NonStandardExceptionIsIsolatedTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) {
        if (item.index == 1) throw 42;
        return succeeded(item);
    };
    batch_orchestrator orchestrator(processor, 100);

    for (bool sequential : {false, true}) {
        batch_outcome outcome = orchestrator.process_batch(make_items(4), 2, sequential);
        ASSERT_EQ(outcome.results.size(), 4);
        EXPECT_EQ(outcome.failed, 1);
        EXPECT_EQ(outcome.processed, 3);
        EXPECT_FALSE(outcome.results[1].success);
        EXPECT_EQ(outcome.results[1].index, 1);
        EXPECT_EQ(outcome.results[1].error_message.value_or(""), "Processing failed: unknown error");
        EXPECT_EQ(outcome.errors, vector<string>({"Processing failed: unknown error"}));
    }
}

TEST_F(BatchOrchestratorTest, ResultOrderTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) {
        // 先提交的后完成
        this_thread::sleep_for(chrono::milliseconds(5 * (8 - item.index)));
        return succeeded(item);
    };
    batch_orchestrator orchestrator(processor, 100);

    auto items = make_items(8);
    batch_outcome outcome = orchestrator.process_batch(items, 4, false);
    ASSERT_EQ(outcome.results.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(outcome.results[i].index, i);
        EXPECT_EQ(outcome.results[i].student, items[i].student);
    }
}

TEST_F(BatchOrchestratorTest, EmptyBatchTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) { return succeeded(item); };
    batch_orchestrator orchestrator(processor, 100);

    batch_outcome outcome = orchestrator.process_batch({}, 4, false);
    EXPECT_TRUE(outcome.results.empty());
    EXPECT_EQ(outcome.total, 0);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.average_score);
}

TEST_F(BatchOrchestratorTest, ConfigErrorTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) {
        ADD_FAILURE() << "no task should start";
        return succeeded(item);
    };
    batch_orchestrator orchestrator(processor, 2);

    EXPECT_THROW(orchestrator.process_batch(make_items(3), 2, false), config_error);
    EXPECT_THROW(orchestrator.process_batch(make_items(1), 0, false), config_error);
}

TEST_F(BatchOrchestratorTest, AggregatesTest) {
    callback_processor processor;
    processor.callback = [](const batch_item &item, const cancellation_token &) {
        switch (item.index) {
            case 0: return succeeded(item, 100.0);
            case 1: return succeeded(item, 85.0);
            case 2: return succeeded(item, 50.0);
            case 3: return succeeded(item);
            default: return failed_item(item, "Code validation failed: Syntax error: invalid syntax (line 1)");
        }
    };
    batch_orchestrator orchestrator(processor, 100);

    batch_outcome outcome = orchestrator.process_batch(make_items(5), 2, false);
    EXPECT_EQ(outcome.total, 5);
    EXPECT_EQ(outcome.processed, 4);
    EXPECT_EQ(outcome.failed, 1);
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.average_score);
    EXPECT_NEAR(*outcome.average_score, 235.0 / 3, 1e-9);
    EXPECT_EQ(outcome.score_distribution["A (90-100)"], 1);
    EXPECT_EQ(outcome.score_distribution["B (80-89)"], 1);
    EXPECT_EQ(outcome.score_distribution["F (0-59)"], 1);
    EXPECT_EQ(outcome.score_distribution.count("C (70-79)"), 0);
    ASSERT_EQ(outcome.errors.size(), 1);
    EXPECT_GE(outcome.processing_time, 0);

    nlohmann::json j = outcome;
    EXPECT_EQ(j.at("failed_files"), 1);
    EXPECT_EQ(j.at("results").size(), 5);
}

TEST_F(BatchOrchestratorTest, ScoreGradeTest) {
    EXPECT_STREQ(score_grade(90), "A (90-100)");
    EXPECT_STREQ(score_grade(89.9), "B (80-89)");
    EXPECT_STREQ(score_grade(70), "C (70-79)");
    EXPECT_STREQ(score_grade(60), "D (60-69)");
    EXPECT_STREQ(score_grade(0), "F (0-59)");
}

TEST_F(BatchOrchestratorTest, CancelTest) {
    fake_backend backend;
    backend.delay = chrono::seconds(5);
    sandbox box(backend, config.run_dir);
    execution_coordinator coordinator(config, box);
    grading_pipeline pipeline(coordinator);
    batch_orchestrator orchestrator(pipeline, config.max_batch_size);

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        orchestrator.cancel();
    });
    auto start = chrono::steady_clock::now();
    batch_outcome outcome = orchestrator.process_batch(make_items(6), 2, false);
    canceller.join();

    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(3));
    EXPECT_TRUE(orchestrator.cancelled());
    ASSERT_EQ(outcome.results.size(), 6);
    EXPECT_EQ(outcome.failed, 6);
    EXPECT_EQ(backend.live_units(), 0);

    size_t in_flight = 0, not_started = 0;
    for (auto &result : outcome.results) {
        if (result.error_message == "Batch cancelled") {
            ++not_started;
        } else {
            ++in_flight;
            EXPECT_EQ(result.status, status::TIMED_OUT);
        }
    }
    EXPECT_EQ(in_flight, 2);
    EXPECT_EQ(not_started, 4);
}

TEST_F(BatchOrchestratorTest, AnalyzerAttachedTest) {
    fake_backend backend;
    sandbox box(backend, config.run_dir);
    execution_coordinator coordinator(config, box);
    line_metrics_analyzer analyzer;
    grading_pipeline pipeline(coordinator, &analyzer);
    batch_orchestrator orchestrator(pipeline, config.max_batch_size);

    batch_outcome outcome = orchestrator.process_batch(make_items(1), 1, false);
    ASSERT_EQ(outcome.results.size(), 1);
    ASSERT_TRUE(outcome.results[0].analysis);
    EXPECT_DOUBLE_EQ(outcome.results[0].analysis->metrics["lines_of_code"], 2);
    EXPECT_FALSE(outcome.results[0].score);
}
