#include "analyzer/analyzer.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const analysis_result &result) {
    j = {{"success", result.success},
         {"issues", result.issues},
         {"metrics", result.metrics}};
}

analyzer::~analyzer() {}

line_metrics_analyzer::line_metrics_analyzer(size_t max_line_length)
    : max_line_length(max_line_length) {}

string line_metrics_analyzer::name() const {
    return "line_metrics";
}

analysis_result line_metrics_analyzer::analyze(const string &source, const string &language) const {
    analysis_result result;
    if (!boost::algorithm::iequals(language, "python")) {
        result.issues.push_back("Analysis not implemented for language: " + language);
        return result;
    }

    vector<string> lines;
    boost::algorithm::split(lines, source, boost::is_any_of("\n"));
    if (!lines.empty() && lines.back().empty()) lines.pop_back();

    int code = 0, blank = 0, comment = 0, functions = 0, classes = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        string line = boost::algorithm::trim_right_copy_if(lines[i], boost::is_any_of("\r"));
        if (line.size() > max_line_length)
            result.issues.push_back(fmt::format("Line {} is too long ({} > {} characters)", i + 1, line.size(), max_line_length));

        string stripped = boost::algorithm::trim_copy(line);
        if (stripped.empty()) {
            ++blank;
        } else if (stripped[0] == '#') {
            ++comment;
        } else {
            ++code;
            if (boost::algorithm::starts_with(stripped, "def ") || boost::algorithm::starts_with(stripped, "async def "))
                ++functions;
            else if (boost::algorithm::starts_with(stripped, "class "))
                ++classes;
        }
    }

    result.metrics["lines_of_code"] = code;
    result.metrics["blank_lines"] = blank;
    result.metrics["comment_lines"] = comment;
    result.metrics["function_count"] = functions;
    result.metrics["class_count"] = classes;
    result.success = true;
    return result;
}

}  // namespace grader
