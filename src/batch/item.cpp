#include "batch/item.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const item_result &result) {
    j = {{"index", result.index},
         {"success", result.success},
         {"status", get_display_message(result.status)},
         {"processing_time", result.processing_time}};
    j["student"] = result.student ? json(*result.student) : json();
    j["score"] = result.score ? json(*result.score) : json();
    j["error_message"] = result.error_message ? json(*result.error_message) : json();
    j["response"] = result.response ? json(*result.response) : json();
    j["analysis"] = result.analysis ? json(*result.analysis) : json();
}

item_result failed_item(const batch_item &item, const string &message) {
    item_result result;
    result.index = item.index;
    result.student = item.student;
    result.success = false;
    result.status = status::ERRORED;
    result.error_message = message;
    return result;
}

}  // namespace grader
