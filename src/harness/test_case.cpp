#include "harness/test_case.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <regex>
#include <stdexcept>

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &tc) {
    // 函数名会原样写进生成的测试代码，只允许 Python 标识符或以 . 连接的属性访问
    static const regex function_matcher(R"(^[A-Za-z_][A-Za-z0-9_]*(\.[A-Za-z_][A-Za-z0-9_]*)*$)");

    if (j.count("function"))
        j.at("function").get_to(tc.function);
    else
        tc.function = "main";
    if (!regex_match(tc.function, function_matcher))
        throw invalid_argument("Invalid test function name: " + tc.function);

    if (j.count("inputs")) {
        tc.inputs = j.at("inputs");
        // 单个参数也允许不写成数组
        if (!tc.inputs.is_array()) tc.inputs = json::array({tc.inputs});
    } else {
        tc.inputs = json::array();
    }

    if (j.count("expected") && !j.at("expected").is_null())
        tc.expected = j.at("expected");
    else
        tc.expected.reset();

    if (j.count("description"))
        j.at("description").get_to(tc.description);
    else
        tc.description.clear();
}

test_style parse_test_style(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    if (lower == "pytest") return test_style::PYTEST;
    if (lower == "unittest") return test_style::UNITTEST;
    throw invalid_argument("Unsupported test framework: " + name);
}

const char *get_display_message(test_style style) {
    switch (style) {
        case test_style::PYTEST: return "pytest";
        case test_style::UNITTEST: return "unittest";
    }
    return "unknown";
}

}  // namespace grader
