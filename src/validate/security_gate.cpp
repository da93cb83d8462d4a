#include "validate/security_gate.hpp"
#include <cstring>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/python.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, deny_pattern &pattern) {
    j.at("pattern").get_to(pattern.pattern);
    if (j.count("label"))
        j.at("label").get_to(pattern.label);
    else
        pattern.label = "Pattern detected: " + pattern.pattern;

    string kind = j.count("kind") ? j.at("kind").get<string>() : "substring";
    if (kind == "import")
        pattern.kind = pattern_kind::IMPORT;
    else if (kind == "substring")
        pattern.kind = pattern_kind::SUBSTRING;
    else if (kind == "regex")
        pattern.kind = pattern_kind::REGEX;
    else
        throw config_error("Unknown deny pattern kind: " + kind);
}

void to_json(json &j, const validation_outcome &outcome) {
    j = {{"is_valid", outcome.valid},
         {"issues", outcome.issues},
         {"security_risks", outcome.risks}};
}

vector<deny_pattern> default_deny_patterns() {
    vector<deny_pattern> patterns;

    for (const char *module : {"os", "sys", "subprocess", "shutil", "signal", "pty", "ctypes",
                               "multiprocessing", "threading", "gc", "importlib", "builtins",
                               "socket", "urllib", "requests", "http", "ftplib", "smtplib",
                               "telnetlib", "imaplib", "nntplib", "email", "asyncio",
                               "pickle", "marshal", "shelve", "dbm", "sqlite3", "json", "pathlib"})
        patterns.push_back({fmt::format("Potentially dangerous import: {}", module), module, pattern_kind::IMPORT});

    for (const char *op : {"open(", "file(", "io.open"})
        patterns.push_back({fmt::format("File operation detected: {}", op), op, pattern_kind::SUBSTRING});

    for (const char *op : {"socket.", "urllib.", "requests.", "http."})
        patterns.push_back({fmt::format("Network operation detected: {}", op), op, pattern_kind::SUBSTRING});

    for (const char *op : {"os.", "sys.", "subprocess.", "system("})
        patterns.push_back({fmt::format("System operation detected: {}", op), op, pattern_kind::SUBSTRING});

    for (const char *op : {"eval(", "exec(", "compile(", "__import__"})
        patterns.push_back({fmt::format("Dynamic code execution detected: {}", op), op, pattern_kind::SUBSTRING});

    for (const char *op : {"globals(", "locals(", "vars(", "getattr(", "setattr(", "delattr(",
                           "__builtins__", "__subclasses__", "__globals__", "__code__"})
        patterns.push_back({fmt::format("Namespace reflection detected: {}", op), op, pattern_kind::SUBSTRING});

    return patterns;
}

static string first_word(const string &text) {
    size_t begin = text.find_first_not_of(" \t\\(");
    if (begin == string::npos) return "";
    size_t end = text.find_first_of(" \t\\()", begin);
    return text.substr(begin, end == string::npos ? string::npos : end - begin);
}

static bool module_matches(const string &name, const string &module) {
    return name == module || boost::algorithm::starts_with(name, module + ".");
}

static bool starts_with_keyword(const string &statement, const char *keyword) {
    size_t len = strlen(keyword);
    return statement.size() > len && statement.compare(0, len, keyword) == 0 &&
           (statement[len] == ' ' || statement[len] == '\t' || statement[len] == '(');
}

bool imports_module(const string &source, const string &module) {
    vector<string> statements;
    boost::split(statements, source, boost::is_any_of("\n;"));
    for (auto &raw : statements) {
        string statement = boost::algorithm::trim_copy(raw);
        if (starts_with_keyword(statement, "import")) {
            vector<string> names;
            boost::split(names, statement.substr(6), boost::is_any_of(","));
            for (auto &name : names)
                if (module_matches(first_word(name), module)) return true;
        } else if (starts_with_keyword(statement, "from")) {
            if (module_matches(first_word(statement.substr(4)), module)) return true;
        }
    }
    return false;
}

string python_syntax_error(const string &source) {
    if (!Py_IsInitialized())
        throw internal_error("Python interpreter is not initialized");
    if (source.find('\0') != string::npos)
        return "source code string cannot contain null bytes";

    GIL_guard guard;
    PyObject *code = Py_CompileStringExFlags(source.c_str(), "<submission>", Py_file_input, nullptr, -1);
    if (code) {
        Py_DECREF(code);
        return "";
    }

    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);

    string message = "unknown error";
    long lineno = -1;
    if (value) {
        bool is_syntax_error = type && PyErr_GivenExceptionMatches(type, PyExc_SyntaxError);
        PyObject *msg = is_syntax_error ? PyObject_GetAttrString(value, "msg") : PyObject_Str(value);
        if (msg && PyUnicode_Check(msg)) {
            const char *text = PyUnicode_AsUTF8(msg);
            if (text) message = text;
        }
        Py_XDECREF(msg);

        if (is_syntax_error) {
            PyObject *line = PyObject_GetAttrString(value, "lineno");
            if (line && PyLong_Check(line)) lineno = PyLong_AsLong(line);
            Py_XDECREF(line);
        }
    }
    PyErr_Clear();
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(traceback);

    if (lineno >= 0)
        return fmt::format("{} (line {})", message, lineno);
    return message;
}

security_gate::security_gate(size_t max_source_size, vector<deny_pattern> patterns, bool risks_fatal)
    : max_source_size(max_source_size), patterns(move(patterns)), risks_fatal(risks_fatal) {
    for (auto &pattern : this->patterns) {
        if (pattern.kind == pattern_kind::SUBSTRING)
            boost::algorithm::to_lower(pattern.pattern);
        if (pattern.kind != pattern_kind::REGEX) {
            regexes.emplace_back();
            continue;
        }
        try {
            regexes.emplace_back(pattern.pattern, regex::ECMAScript);
        } catch (regex_error &e) {
            throw config_error(fmt::format("Invalid deny pattern regex '{}': {}", pattern.pattern, e.what()));
        }
    }
}

void security_gate::check_python(const string &source, validation_outcome &outcome) const {
    if (source.size() > max_source_size) {
        outcome.issues.push_back(fmt::format("Code too large: {} bytes (max: {})", source.size(), max_source_size));
    } else {
        // 超大的代码不再编译，避免解析本身耗尽资源
        string error = python_syntax_error(source);
        if (!error.empty())
            outcome.issues.push_back("Syntax error: " + error);
    }

    string lowered = boost::algorithm::to_lower_copy(source);
    for (size_t i = 0; i < patterns.size(); ++i) {
        const deny_pattern &pattern = patterns[i];
        bool matched = false;
        switch (pattern.kind) {
            case pattern_kind::IMPORT:
                matched = imports_module(source, pattern.pattern);
                break;
            case pattern_kind::SUBSTRING:
                matched = lowered.find(pattern.pattern) != string::npos;
                break;
            case pattern_kind::REGEX:
                matched = regex_search(source, regexes[i]);
                break;
        }
        if (matched) outcome.risks.push_back(pattern.label);
    }
}

validation_outcome security_gate::validate(const string &source, const string &language) const noexcept {
    validation_outcome outcome;
    try {
        if (boost::algorithm::to_lower_copy(language) == "python") {
            check_python(source, outcome);
        } else {
            outcome.issues.push_back("Validation not implemented for language: " + language);
        }
    } catch (std::exception &e) {
        // 检查本身出错时拒绝执行
        LOG(ERROR) << "security gate failed: " << e.what();
        outcome.issues.push_back(string("Validation failed: ") + e.what());
    }

    outcome.valid = outcome.issues.empty() && (!risks_fatal || outcome.risks.empty());
    if (!outcome.risks.empty() && outcome.issues.empty())
        LOG(WARNING) << "code contains " << outcome.risks.size() << " potential security risks";
    return outcome;
}

}  // namespace grader
