#include "execution/request.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const execution_response &response) {
    j = {{"status", get_display_message(response.status)},
         {"error", get_display_message(response.error)},
         {"validation", response.validation}};
    j["execution"] = response.execution ? json(*response.execution) : json();
    j["tests"] = response.tests ? json(*response.tests) : json();
    j["error_message"] = response.error_message ? json(*response.error_message) : json();
}

}  // namespace grader
