#include "harness/python_literal.hpp"
#include <fmt/core.h>
#include <cmath>

namespace grader {
using namespace std;
using namespace nlohmann;

string python_string(const string &text) {
    string result;
    result.reserve(text.size() + 2);
    result += '\'';
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        switch (ch) {
            case '\\': result += "\\\\"; break;
            case '\'': result += "\\'"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f)
                    result += fmt::format("\\x{:02x}", c);
                else
                    result += ch;  // UTF-8 字节原样保留
        }
    }
    result += '\'';
    return result;
}

static string python_float(double value) {
    if (isnan(value)) return "float('nan')";
    if (isinf(value)) return value > 0 ? "float('inf')" : "-float('inf')";
    // nlohmann::json 输出最短的往返表示，并且总是带小数点或指数
    return json(value).dump();
}

string python_literal(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return "None";
        case json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case json::value_t::number_integer:
            return to_string(value.get<int64_t>());
        case json::value_t::number_unsigned:
            return to_string(value.get<uint64_t>());
        case json::value_t::number_float:
            return python_float(value.get<double>());
        case json::value_t::string:
            return python_string(value.get<string>());
        case json::value_t::array: {
            string result = "[";
            bool first = true;
            for (auto &element : value) {
                if (!first) result += ", ";
                result += python_literal(element);
                first = false;
            }
            return result + "]";
        }
        case json::value_t::object: {
            string result = "{";
            bool first = true;
            for (auto &[key, element] : value.items()) {
                if (!first) result += ", ";
                result += python_string(key) + ": " + python_literal(element);
                first = false;
            }
            return result + "}";
        }
        default:
            return "None";
    }
    return "None";
}

}  // namespace grader
