#include "harness/harness_builder.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/replace.hpp>
#include "harness/python_literal.hpp"

namespace grader {
using namespace std;

// clang-format off
static const char *PYTEST_PLUGIN = R"PY(import json
import os

_records = []
_collection_errors = []


def pytest_collectreport(report):
    if report.failed:
        _collection_errors.append({
            'nodeid': report.nodeid or 'collection',
            'outcome': 'error',
            'message': str(report.longrepr),
            'stdout': '',
        })


def pytest_runtest_logreport(report):
    if report.when == 'call' or (report.when == 'setup' and not report.passed):
        outcome = report.outcome
        if report.when == 'setup' and report.failed:
            outcome = 'error'
        _records.append({
            'nodeid': report.nodeid,
            'outcome': outcome,
            'message': str(report.longrepr) if report.failed else '',
            'stdout': report.capstdout,
        })


def pytest_sessionfinish(session, exitstatus):
    scratch = os.environ.get('SCRATCH_DIR')
    if not scratch:
        return
    records = _collection_errors + _records
    passed = sum(1 for r in records if r['outcome'] == 'passed')
    summary = {'total': len(records), 'passed': passed, 'collection_errors': len(_collection_errors)}
    with open(os.path.join(scratch, 'report.json'), 'w') as f:
        json.dump({'summary': summary, 'tests': records}, f)
)PY";

static const char *UNITTEST_RUNNER = R"PY(import json
import os
import sys
import traceback
import unittest


class _RecordingResult(unittest.TextTestResult):
    def __init__(self, *args, **kwargs):
        super().__init__(*args, **kwargs)
        self.records = []

    def _record(self, test, outcome, message=''):
        self.records.append({'nodeid': test.id(), 'outcome': outcome, 'message': message, 'stdout': ''})

    def addSuccess(self, test):
        super().addSuccess(test)
        self._record(test, 'passed')

    def addFailure(self, test, err):
        super().addFailure(test, err)
        self._record(test, 'failed', self.failures[-1][1])

    def addError(self, test, err):
        super().addError(test, err)
        self._record(test, 'error', self.errors[-1][1])

    def addSkip(self, test, reason):
        super().addSkip(test, reason)
        self._record(test, 'skipped', reason)

    def addExpectedFailure(self, test, err):
        super().addExpectedFailure(test, err)
        self._record(test, 'passed')

    def addUnexpectedSuccess(self, test):
        super().addUnexpectedSuccess(test)
        self._record(test, 'failed', 'unexpected success')


def main(module):
    loader = unittest.TestLoader()
    try:
        suite = loader.loadTestsFromName(module)
    except Exception:
        suite = None
        loader.errors.append(traceback.format_exc())

    records, successful = [], False
    if not loader.errors:
        runner = unittest.TextTestRunner(stream=sys.stdout, verbosity=2, resultclass=_RecordingResult)
        result = runner.run(suite)
        records, successful = result.records, result.wasSuccessful()
    for message in loader.errors:
        sys.stderr.write(message)
        records.append({'nodeid': module, 'outcome': 'error', 'message': message, 'stdout': ''})

    scratch = os.environ.get('SCRATCH_DIR')
    if scratch:
        passed = sum(1 for r in records if r['outcome'] == 'passed')
        summary = {'total': len(records), 'passed': passed, 'collection_errors': len(loader.errors)}
        with open(os.path.join(scratch, 'report.json'), 'w') as f:
            json.dump({'summary': summary, 'tests': records}, f)
    return 0 if successful else 1


if __name__ == '__main__':
    sys.exit(main(sys.argv[1] if len(sys.argv) > 1 else 'test_code'))
)PY";
// clang-format on

static string call_expression(const test_case &tc) {
    string args;
    for (auto &input : tc.inputs) {
        if (!args.empty()) args += ", ";
        args += python_literal(input);
    }
    return fmt::format("{}({})", tc.function, args);
}

/**
 * @brief 断言失败时的提示，形如 'test_case_2 (desc): expected {!r}, got {!r}'
 */
static string failure_message(const string &name, const test_case &tc) {
    string description = tc.description.empty() ? "no description" : tc.description;
    // 提示会经过 str.format，描述里的花括号需要转义
    boost::algorithm::replace_all(description, "{", "{{");
    boost::algorithm::replace_all(description, "}", "}}");
    return python_string(fmt::format("{} ({}): expected {{!r}}, got {{!r}}", name, description));
}

static string build_pytest(const vector<test_case> &cases) {
    string code = "from solution import *\n";
    for (size_t i = 0; i < cases.size(); ++i) {
        const test_case &tc = cases[i];
        string name = fmt::format("test_case_{}", i + 1);
        code += fmt::format("\n\ndef {}():\n", name);
        if (!tc.description.empty())
            code += fmt::format("    {}\n", python_string(tc.description));
        if (tc.expected) {
            code += fmt::format("    expected = {}\n", python_literal(*tc.expected));
            code += fmt::format("    result = {}\n", call_expression(tc));
            code += fmt::format("    assert result == expected, {}.format(expected, result)\n", failure_message(name, tc));
        } else {
            code += fmt::format("    {}\n", call_expression(tc));
        }
    }
    return code;
}

static string build_unittest(const vector<test_case> &cases) {
    string code = "import unittest\n\nfrom solution import *\n\n\nclass TestCode(unittest.TestCase):\n";
    if (cases.empty()) code += "    pass\n";
    for (size_t i = 0; i < cases.size(); ++i) {
        const test_case &tc = cases[i];
        string name = fmt::format("test_case_{}", i + 1);
        if (i > 0) code += "\n";
        code += fmt::format("    def {}(self):\n", name);
        if (!tc.description.empty())
            code += fmt::format("        {}\n", python_string(tc.description));
        if (tc.expected) {
            code += fmt::format("        expected = {}\n", python_literal(*tc.expected));
            code += fmt::format("        result = {}\n", call_expression(tc));
            code += fmt::format("        self.assertEqual(result, expected, {}.format(expected, result))\n", failure_message(name, tc));
        } else {
            code += fmt::format("        {}\n", call_expression(tc));
        }
    }
    code += "\n\nif __name__ == '__main__':\n    unittest.main()\n";
    return code;
}

string build_harness(const test_spec &spec, test_style style) {
    if (auto raw = get_if<string>(&spec))
        return *raw;

    auto &cases = get<vector<test_case>>(spec);
    switch (style) {
        case test_style::PYTEST:
            return build_pytest(cases);
        case test_style::UNITTEST:
            return build_unittest(cases);
    }
    return "";
}

map<string, string> harness_support_files(test_style style) {
    switch (style) {
        case test_style::PYTEST:
            return {{"conftest.py", PYTEST_PLUGIN}};
        case test_style::UNITTEST:
            return {{"grader_report.py", UNITTEST_RUNNER}};
    }
    return {};
}

vector<string> harness_command(test_style style) {
    switch (style) {
        case test_style::PYTEST:
            return {"python3", "-m", "pytest", HARNESS_FILE, "-v", "--tb=short", "-p", "no:cacheprovider"};
        case test_style::UNITTEST:
            return {"python3", "grader_report.py", "test_code"};
    }
    return {};
}

}  // namespace grader
