#include "sandbox/execution_result.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"exit_code", result.exit_code},
         {"execution_time", result.execution_time},
         {"timed_out", result.timed_out},
         {"error", get_display_message(result.error)}};
    if (result.memory_used) j["memory_used"] = *result.memory_used;
    else j["memory_used"] = nullptr;
    if (result.error_message) j["error_message"] = *result.error_message;
    else j["error_message"] = nullptr;
}

}  // namespace grader
