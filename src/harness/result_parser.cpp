#include "harness/result_parser.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <cstdint>
#include <regex>
#include "harness/harness_builder.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool test_outcome::parse_failed() const {
    return total == 0 && raw_output.find_first_not_of(" \t\r\n") != string::npos;
}

double test_outcome::pass_rate() const {
    return total > 0 ? 100.0 * passed / total : 0;
}

void to_json(json &j, const test_outcome &outcome) {
    json failures = json::array();
    for (auto &failure : outcome.failures)
        failures.push_back({{"name", failure.name}, {"message", failure.message}, {"output", failure.output}});
    j = {{"total_tests", outcome.total},
         {"passed_tests", outcome.passed},
         {"failed_tests", failures},
         {"test_output", outcome.raw_output}};
}

/**
 * @brief 解析非负计数，超出 int 范围时返回 false
 */
static bool parse_count(const string &text, int &count) {
    return boost::conversion::try_lexical_convert(text, count) && count >= 0;
}

static string string_field(const json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<string>();
    return it->dump();
}

bool parse_structured_report(const string &report, test_outcome &outcome) {
    json j = json::parse(report, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto summary = j.find("summary");
    if (summary == j.end() || !summary->is_object()) return false;
    auto total = summary->find("total"), passed = summary->find("passed");
    if (total == summary->end() || passed == summary->end() ||
        !total->is_number_integer() || !passed->is_number_integer())
        return false;

    int64_t total_count = total->get<int64_t>(), passed_count = passed->get<int64_t>();
    if (passed_count < 0 || total_count < passed_count || total_count > INT32_MAX) return false;

    int64_t collection_errors = 0;
    auto collection = summary->find("collection_errors");
    if (collection != summary->end()) {
        if (!collection->is_number_integer()) return false;
        collection_errors = collection->get<int64_t>();
        if (collection_errors < 0 || collection_errors > total_count) return false;
    }

    outcome.total = (int)total_count;
    outcome.passed = (int)passed_count;
    outcome.collection_errors = (int)collection_errors;
    outcome.failures.clear();

    auto tests = j.find("tests");
    if (tests != j.end() && tests->is_array()) {
        for (auto &test : *tests) {
            if (!test.is_object()) continue;
            string result = string_field(test, "outcome");
            if (result != "failed" && result != "error") continue;
            outcome.failures.push_back({string_field(test, "nodeid"), string_field(test, "message"), string_field(test, "stdout")});
        }
    }
    outcome.source = parse_source::STRUCTURED;
    return true;
}

bool parse_pytest_text(const string &text, test_outcome &outcome) {
    static const regex count_matcher(R"((\d+) (passed|failed|errors?|skipped|xfailed|xpassed)\b)");
    static const regex failed_matcher(R"(^(FAILED|ERROR) (\S+)(?: - (.*))?$)");

    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));

    // 汇总行一般在最后，取最后一个包含计数的行
    bool found = false;
    int64_t passed = 0, failed = 0, errors = 0, skipped = 0;
    int collection_errors = 0;
    vector<failed_test> failures;
    for (auto &raw : lines) {
        string line = boost::algorithm::trim_right_copy(raw);
        smatch match;
        if (regex_match(line, match, failed_matcher)) {
            if (match[1] == "ERROR" && match[2].str().find("::") == string::npos)
                ++collection_errors;
            failures.push_back({match[2].str(), match[3].str(), ""});
            continue;
        }

        int64_t line_passed = 0, line_failed = 0, line_errors = 0, line_skipped = 0;
        bool line_found = false, line_valid = true;
        for (sregex_iterator it(line.begin(), line.end(), count_matcher), end; it != end; ++it) {
            int count;
            if (!parse_count((*it)[1].str(), count)) {
                line_valid = false;
                break;
            }
            string kind = (*it)[2].str();
            if (kind == "passed" || kind == "xpassed")
                line_passed += count;
            else if (kind == "failed")
                line_failed += count;
            else if (kind == "error" || kind == "errors")
                line_errors += count;
            else
                line_skipped += count;
            line_found = true;
        }
        if (line_found && line_valid && line_passed + line_failed + line_errors + line_skipped <= INT32_MAX) {
            found = true;
            passed = line_passed;
            failed = line_failed;
            errors = line_errors;
            skipped = line_skipped;
        }
    }

    if (!found) return false;
    outcome.total = (int)(passed + failed + errors + skipped);
    outcome.passed = (int)passed;
    outcome.collection_errors = min<int>(collection_errors, (int)errors);
    outcome.failures = move(failures);
    outcome.source = parse_source::TEXT;
    return true;
}

/**
 * @brief 提取 "FAILED (failures=1, errors=2, skipped=1)" 或 "OK (skipped=1)" 中的计数
 * @return 计数超出 int 范围时返回 false，没有该项时计数为 0
 */
static bool count_of(const string &line, const string &key, int &count) {
    smatch match;
    regex matcher(key + R"(=(\d+))");
    count = 0;
    if (regex_search(line, match, matcher))
        return parse_count(match[1].str(), count);
    return true;
}

static bool is_separator(const string &line) {
    return line.size() >= 10 && (line.find_first_not_of('=') == string::npos || line.find_first_not_of('-') == string::npos);
}

bool parse_unittest_text(const string &text, test_outcome &outcome) {
    static const regex ran_matcher(R"(^Ran (\d+) tests?)");
    static const regex block_matcher(R"(^(FAIL|ERROR): (.*)$)");

    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));

    bool found = false;
    int total = 0, failures = 0, errors = 0, skipped = 0, collection_errors = 0;
    vector<failed_test> failed;
    for (size_t i = 0; i < lines.size(); ++i) {
        string line = boost::algorithm::trim_right_copy(lines[i]);
        smatch match;
        if (regex_search(line, match, ran_matcher)) {
            if (!parse_count(match[1].str(), total)) return false;
            found = true;
        } else if (boost::algorithm::starts_with(line, "FAILED (") || boost::algorithm::starts_with(line, "OK (")) {
            if (!count_of(line, "failures", failures) || !count_of(line, "errors", errors) ||
                !count_of(line, "skipped", skipped))
                return false;
        } else if (regex_match(line, match, block_matcher)) {
            // 导入测试模块失败时 unittest 会生成一个 _FailedTest
            if (match[1] == "ERROR" && match[2].str().find("unittest.loader._FailedTest") != string::npos)
                ++collection_errors;
            // FAIL: 之后是一行分隔符，然后是 traceback，直到下一个分隔符
            failed_test test{match[2].str(), "", ""};
            size_t j = i + 1;
            if (j < lines.size() && is_separator(boost::algorithm::trim_right_copy(lines[j]))) ++j;
            vector<string> message;
            for (; j < lines.size(); ++j) {
                string body = boost::algorithm::trim_right_copy(lines[j]);
                if (is_separator(body)) break;
                message.push_back(body);
            }
            test.message = boost::algorithm::trim_copy(boost::algorithm::join(message, "\n"));
            failed.push_back(move(test));
            i = j - 1;
        }
    }

    if (!found) return false;
    int64_t not_passed = (int64_t)failures + errors + skipped;
    outcome.total = total;
    outcome.passed = (int)max<int64_t>(0, total - not_passed);
    outcome.collection_errors = min(collection_errors, errors);
    outcome.failures = move(failed);
    outcome.source = parse_source::TEXT;
    return true;
}

static bool parse_text(const string &text, test_style style, test_outcome &outcome) {
    switch (style) {
        case test_style::PYTEST:
            return parse_pytest_text(text, outcome);
        case test_style::UNITTEST:
            return parse_unittest_text(text, outcome);
    }
    return false;
}

test_outcome parse_test_output(const execution_result &result, test_style style) {
    test_outcome outcome;
    outcome.raw_output = result.stdout_data;

    auto report = result.artifacts.find(REPORT_FILE);
    if (report != result.artifacts.end()) {
        if (parse_structured_report(report->second, outcome))
            return outcome;
        LOG(WARNING) << "malformed test report, falling back to text output";
    }

    if (parse_text(result.stdout_data, style, outcome) ||
        parse_text(result.stderr_data, style, outcome))
        return outcome;

    outcome.total = outcome.passed = outcome.collection_errors = 0;
    outcome.failures.clear();
    outcome.source = parse_source::NONE;
    return outcome;
}

}  // namespace grader
