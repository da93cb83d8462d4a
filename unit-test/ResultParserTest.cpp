#include "gtest/gtest.h"
#include "harness/harness_builder.hpp"
#include "harness/result_parser.hpp"

using namespace std;
using namespace grader;

static const char *PYTEST_OUTPUT = R"(============================= test session starts ==============================
collected 3 items

test_code.py::test_case_1 PASSED                                         [ 33%]
test_code.py::test_case_2 FAILED                                         [ 66%]
test_code.py::test_case_3 PASSED                                         [100%]

=========================== short test summary info ============================
FAILED test_code.py::test_case_2 - AssertionError: test_case_2 (no description): expected 5, got 4
========================= 1 failed, 2 passed in 0.05s ==========================
)";

static const char *UNITTEST_OUTPUT = R"(test_case_1 (test_code.TestCode.test_case_1) ... ok
test_case_2 (test_code.TestCode.test_case_2) ... FAIL
test_case_3 (test_code.TestCode.test_case_3) ... ERROR

======================================================================
ERROR: test_case_3 (test_code.TestCode.test_case_3)
----------------------------------------------------------------------
Traceback (most recent call last):
NameError: name 'mul' is not defined

======================================================================
FAIL: test_case_2 (test_code.TestCode.test_case_2)
----------------------------------------------------------------------
Traceback (most recent call last):
AssertionError: 4 != 5 : test_case_2 (no description): expected 5, got 4

----------------------------------------------------------------------
Ran 3 tests in 0.001s

FAILED (failures=1, errors=1)
)";

static execution_result result_of(const string &stdout_data, const string &stderr_data = "") {
    execution_result result;
    result.stdout_data = stdout_data;
    result.stderr_data = stderr_data;
    result.exit_code = 1;
    return result;
}

TEST(ResultParserTest, StructuredReportTest) {
    execution_result result = ::result_of("whatever");
    result.artifacts[REPORT_FILE] = R"({"summary": {"total": 2, "passed": 1}, "tests": [
        {"nodeid": "test_code.py::test_case_1", "outcome": "passed", "message": "", "stdout": ""},
        {"nodeid": "test_code.py::test_case_2", "outcome": "failed", "message": "expected 5, got 4", "stdout": "debug"}
    ]})";

    test_outcome outcome = parse_test_output(result, test_style::PYTEST);
    EXPECT_EQ(outcome.source, parse_source::STRUCTURED);
    EXPECT_EQ(outcome.total, 2);
    EXPECT_EQ(outcome.passed, 1);
    ASSERT_EQ(outcome.failures.size(), 1);
    EXPECT_EQ(outcome.failures[0].name, "test_code.py::test_case_2");
    EXPECT_EQ(outcome.failures[0].message, "expected 5, got 4");
    EXPECT_EQ(outcome.failures[0].output, "debug");
    EXPECT_EQ(outcome.raw_output, "whatever");
    EXPECT_DOUBLE_EQ(outcome.pass_rate(), 50);
}

TEST(ResultParserTest, CorruptedReportFallsBackToTextTest) {
    execution_result result = ::result_of(PYTEST_OUTPUT);
    result.artifacts[REPORT_FILE] = R"({"summary": {"total": 2, "pass)";

    test_outcome outcome = parse_test_output(result, test_style::PYTEST);
    EXPECT_EQ(outcome.source, parse_source::TEXT);
    EXPECT_EQ(outcome.total, 3);
    EXPECT_EQ(outcome.passed, 2);
    ASSERT_EQ(outcome.failures.size(), 1);
    EXPECT_EQ(outcome.failures[0].name, "test_code.py::test_case_2");
    EXPECT_NE(outcome.failures[0].message.find("expected 5, got 4"), string::npos);
}

TEST(ResultParserTest, InconsistentReportIsRejectedTest) {
    test_outcome outcome;
    EXPECT_FALSE(parse_structured_report(R"({"summary": {"total": 1, "passed": 2}})", outcome));
    EXPECT_FALSE(parse_structured_report(R"({"summary": {"total": "2", "passed": 1}})", outcome));
    EXPECT_FALSE(parse_structured_report(R"({"summary": {"total": 2, "passed": -1}})", outcome));
    EXPECT_FALSE(parse_structured_report(R"([1, 2])", outcome));
    EXPECT_TRUE(parse_structured_report(R"({"summary": {"total": 0, "passed": 0}})", outcome));
}

TEST(ResultParserTest, PytestErrorsTest) {
    test_outcome outcome;
    ASSERT_TRUE(parse_pytest_text("==== 1 passed, 1 skipped, 2 errors in 0.10s ====\n", outcome));
    EXPECT_EQ(outcome.total, 4);
    EXPECT_EQ(outcome.passed, 1);
}

TEST(ResultParserTest, UnittestTextTest) {
    test_outcome outcome = parse_test_output(::result_of(UNITTEST_OUTPUT), test_style::UNITTEST);
    EXPECT_EQ(outcome.source, parse_source::TEXT);
    EXPECT_EQ(outcome.total, 3);
    EXPECT_EQ(outcome.passed, 1);
    ASSERT_EQ(outcome.failures.size(), 2);
    EXPECT_EQ(outcome.failures[0].name, "test_case_3 (test_code.TestCode.test_case_3)");
    EXPECT_NE(outcome.failures[0].message.find("NameError"), string::npos);
    EXPECT_EQ(outcome.failures[1].name, "test_case_2 (test_code.TestCode.test_case_2)");
    EXPECT_NE(outcome.failures[1].message.find("expected 5, got 4"), string::npos);
}

TEST(ResultParserTest, UnittestOnStderrTest) {
    // unittest.main() 默认输出到 stderr
    test_outcome outcome = parse_test_output(::result_of("", "..\n----\nRan 2 tests in 0.000s\n\nOK\n"), test_style::UNITTEST);
    EXPECT_EQ(outcome.total, 2);
    EXPECT_EQ(outcome.passed, 2);
    EXPECT_TRUE(outcome.raw_output.empty());
}

TEST(ResultParserTest, EmptyOutputTest) {
    test_outcome outcome = parse_test_output(::result_of(""), test_style::PYTEST);
    EXPECT_EQ(outcome.total, 0);
    EXPECT_EQ(outcome.source, parse_source::NONE);
    EXPECT_TRUE(outcome.raw_output.empty());
    EXPECT_FALSE(outcome.parse_failed());
    EXPECT_DOUBLE_EQ(outcome.pass_rate(), 0);
}

TEST(ResultParserTest, UnparsableOutputTest) {
    test_outcome outcome = parse_test_output(::result_of("Segmentation fault\n"), test_style::PYTEST);
    EXPECT_EQ(outcome.total, 0);
    EXPECT_EQ(outcome.raw_output, "Segmentation fault\n");
    EXPECT_TRUE(outcome.parse_failed());
}

TEST(ResultParserTest, CollectionErrorReportTest) {
    test_outcome outcome;
    ASSERT_TRUE(parse_structured_report(R"({"summary": {"total": 1, "passed": 0, "collection_errors": 1}, "tests": [
        {"nodeid": "test_code.py", "outcome": "error", "message": "RuntimeError: boom at import"}]})", outcome));
    EXPECT_EQ(outcome.total, 1);
    EXPECT_EQ(outcome.passed, 0);
    EXPECT_EQ(outcome.collection_errors, 1);
    ASSERT_EQ(outcome.failures.size(), 1);
    EXPECT_NE(outcome.failures[0].message.find("boom at import"), string::npos);

    EXPECT_FALSE(parse_structured_report(R"({"summary": {"total": 0, "passed": 0, "collection_errors": 1}})", outcome));
    EXPECT_FALSE(parse_structured_report(R"({"summary": {"total": 1, "passed": 0, "collection_errors": "1"}})", outcome));
}

TEST(ResultParserTest, PytestCollectionErrorTest) {
    test_outcome outcome;
    ASSERT_TRUE(parse_pytest_text(R"(==================================== ERRORS ====================================
________________________ ERROR collecting test_code.py _________________________
E   RuntimeError: boom at import
=========================== short test summary info ============================
ERROR test_code.py - RuntimeError: boom at import
!!!!!!!!!!!!!!!!!!!! Interrupted: 1 error during collection !!!!!!!!!!!!!!!!!!!!
=============================== 1 error in 0.21s ===============================
)", outcome));
    EXPECT_EQ(outcome.total, 1);
    EXPECT_EQ(outcome.passed, 0);
    EXPECT_EQ(outcome.collection_errors, 1);
    ASSERT_EQ(outcome.failures.size(), 1);
    EXPECT_EQ(outcome.failures[0].name, "test_code.py");

    // 测试函数内的 ERROR 不是收集错误
    ASSERT_TRUE(parse_pytest_text("ERROR test_code.py::test_case_1 - TypeError\n==== 1 error in 0.01s ====\n", outcome));
    EXPECT_EQ(outcome.collection_errors, 0);
}

TEST(ResultParserTest, UnittestImportErrorTest) {
    test_outcome outcome;
    ASSERT_TRUE(parse_unittest_text(R"(E
======================================================================
ERROR: test_code (unittest.loader._FailedTest.test_code)
----------------------------------------------------------------------
ImportError: Failed to import test module: test_code
RuntimeError: boom at import

----------------------------------------------------------------------
Ran 1 test in 0.000s

FAILED (errors=1)
)", outcome));
    EXPECT_EQ(outcome.total, 1);
    EXPECT_EQ(outcome.passed, 0);
    EXPECT_EQ(outcome.collection_errors, 1);
}

TEST(ResultParserTest, OverflowingCountTest) {
    test_outcome outcome;
    EXPECT_NO_THROW(EXPECT_FALSE(parse_pytest_text("==== 99999999999 passed in 0.01s ====\n", outcome)));
    EXPECT_NO_THROW(EXPECT_FALSE(parse_pytest_text("==== 2147483647 passed, 1 failed in 0.01s ====\n", outcome)));
    EXPECT_NO_THROW(EXPECT_FALSE(parse_unittest_text("Ran 99999999999 tests in 0.001s\n\nOK\n", outcome)));
    EXPECT_NO_THROW(
        EXPECT_FALSE(parse_unittest_text("Ran 2 tests in 0.001s\n\nFAILED (failures=99999999999)\n", outcome)));

    // 溢出的汇总行被忽略，后面正常的汇总行仍然有效
    ASSERT_TRUE(parse_pytest_text("99999999999 passed in 0.01s\n==== 1 passed in 0.01s ====\n", outcome));
    EXPECT_EQ(outcome.total, 1);

    execution_result result = ::result_of("==== 99999999999 passed in 0.01s ====\n");
    EXPECT_NO_THROW(outcome = parse_test_output(result, test_style::PYTEST));
    EXPECT_EQ(outcome.source, parse_source::NONE);
    EXPECT_EQ(outcome.total, 0);
    EXPECT_TRUE(outcome.parse_failed());
}
