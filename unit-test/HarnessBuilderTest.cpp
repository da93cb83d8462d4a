#include "gtest/gtest.h"
#include "harness/harness_builder.hpp"

using namespace std;
using namespace grader;
using nlohmann::json;

static vector<test_case> add_cases() {
    return json::parse(R"([
        {"function": "add", "inputs": [2, 3], "expected": 5, "description": "small numbers"},
        {"function": "add", "inputs": [2, 2], "expected": 5}
    ])").get<vector<test_case>>();
}

TEST(HarnessBuilderTest, RawHarnessPassThroughTest) {
    string raw = "def test_anything():\n    assert True\n";
    EXPECT_EQ(build_harness(raw, test_style::PYTEST), raw);
    EXPECT_EQ(build_harness(raw, test_style::UNITTEST), raw);
}

TEST(HarnessBuilderTest, PytestTest) {
    string code = build_harness(add_cases(), test_style::PYTEST);
    EXPECT_NE(code.find("from solution import *"), string::npos);
    size_t first = code.find("def test_case_1():");
    size_t second = code.find("def test_case_2():");
    ASSERT_NE(first, string::npos);
    ASSERT_NE(second, string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(code.find("    result = add(2, 3)\n"), string::npos);
    EXPECT_NE(code.find("    expected = 5\n"), string::npos);
    EXPECT_NE(code.find("'test_case_1 (small numbers): expected {!r}, got {!r}'"), string::npos) << code;
    EXPECT_NE(code.find("'test_case_2 (no description): expected {!r}, got {!r}'"), string::npos) << code;
    EXPECT_EQ(code.find("def test_case_3"), string::npos);
}

TEST(HarnessBuilderTest, UnittestTest) {
    string code = build_harness(add_cases(), test_style::UNITTEST);
    EXPECT_NE(code.find("import unittest"), string::npos);
    EXPECT_NE(code.find("class TestCode(unittest.TestCase):"), string::npos);
    EXPECT_NE(code.find("    def test_case_1(self):"), string::npos);
    EXPECT_NE(code.find("    def test_case_2(self):"), string::npos);
    EXPECT_NE(code.find("self.assertEqual(result, expected, "), string::npos);
}

TEST(HarnessBuilderTest, WithoutExpectedTest) {
    auto cases = json::parse(R"([{"function": "main"}])").get<vector<test_case>>();
    string code = build_harness(cases, test_style::PYTEST);
    EXPECT_NE(code.find("    main()\n"), string::npos);
    EXPECT_EQ(code.find("assert"), string::npos);
}

TEST(HarnessBuilderTest, DescriptionEscapeTest) {
    auto cases = json::parse(R"([{"function": "f", "inputs": [], "expected": 1, "description": "it's {weird}\n"}])").get<vector<test_case>>();
    string code = build_harness(cases, test_style::PYTEST);
    EXPECT_NE(code.find(R"('it\'s {weird}\n')"), string::npos) << code;
    EXPECT_NE(code.find(R"(it\'s {{weird}}\n)"), string::npos) << code;
}

TEST(HarnessBuilderTest, ScalarInputsAreWrappedTest) {
    auto tc = json::parse(R"({"function": "square", "inputs": 4, "expected": 16})").get<test_case>();
    ASSERT_TRUE(tc.inputs.is_array());
    EXPECT_EQ(tc.inputs.size(), 1);
    string code = build_harness(vector<test_case>{tc}, test_style::PYTEST);
    EXPECT_NE(code.find("square(4)"), string::npos);
}

TEST(HarnessBuilderTest, FunctionNameTest) {
    auto method = json::parse(R"({"function": "Solution.add", "inputs": [1, 2], "expected": 3})").get<test_case>();
    string code = build_harness(vector<test_case>{method}, test_style::PYTEST);
    EXPECT_NE(code.find("Solution.add(1, 2)"), string::npos) << code;

    for (const char *name : {"add(1); import os; os.system('id'); f", "add\nimport os", "", "1add", "a..b", "add.", "os.system(\"id\")"}) {
        json j = {{"function", name}, {"inputs", json::array()}};
        EXPECT_THROW(j.get<test_case>(), invalid_argument) << name;
    }
}

TEST(HarnessBuilderTest, SupportFilesTest) {
    auto pytest_files = harness_support_files(test_style::PYTEST);
    ASSERT_EQ(pytest_files.count("conftest.py"), 1);
    EXPECT_NE(pytest_files["conftest.py"].find("SCRATCH_DIR"), string::npos);

    auto unittest_files = harness_support_files(test_style::UNITTEST);
    ASSERT_EQ(unittest_files.count("grader_report.py"), 1);
    EXPECT_NE(unittest_files["grader_report.py"].find("report.json"), string::npos);
}

TEST(HarnessBuilderTest, CommandTest) {
    auto pytest = harness_command(test_style::PYTEST);
    ASSERT_GE(pytest.size(), 4);
    EXPECT_EQ(pytest[0], "python3");
    EXPECT_EQ(pytest[1], "-m");
    EXPECT_EQ(pytest[2], "pytest");
    EXPECT_EQ(pytest[3], HARNESS_FILE);

    vector<string> unittest = {"python3", "grader_report.py", "test_code"};
    EXPECT_EQ(harness_command(test_style::UNITTEST), unittest);
}

TEST(HarnessBuilderTest, TestStyleTest) {
    EXPECT_EQ(parse_test_style("PyTest"), test_style::PYTEST);
    EXPECT_EQ(parse_test_style("unittest"), test_style::UNITTEST);
    EXPECT_THROW(parse_test_style("nose"), invalid_argument);
}
