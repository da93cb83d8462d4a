#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::RECEIVED, "Received")
    (status::VALIDATED, "Validated")
    (status::RUNNING, "Running")
    (status::REJECTED, "Rejected")
    (status::TIMED_OUT, "Timed Out")
    (status::COMPLETED, "Completed")
    (status::ERRORED, "Errored");

static const unordered_map<error_kind, const char *> error_kind_string = boost::assign::map_list_of
    (error_kind::NONE, "None")
    (error_kind::REJECTED_BY_POLICY, "Rejected By Policy")
    (error_kind::TIMED_OUT, "Timed Out")
    (error_kind::RUNTIME_UNAVAILABLE, "Runtime Unavailable")
    (error_kind::EXECUTION_FAILED, "Execution Failed")
    (error_kind::PARSE_AMBIGUOUS, "Parse Ambiguous");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(error_kind kind) {
    return error_kind_string.at(kind);
}

bool is_terminal(status stat) {
    return stat == status::REJECTED || stat == status::TIMED_OUT ||
           stat == status::COMPLETED || stat == status::ERRORED;
}

}  // namespace grader
