#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include <cmath>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

void check_limits(const sandbox_limits &limits) {
    if (!isfinite(limits.wall_time) || limits.wall_time <= 0)
        throw sandbox_unavailable(fmt::format("Invalid wall time limit: {}", limits.wall_time));
    if (limits.memory_limit <= 0)
        throw sandbox_unavailable(fmt::format("Invalid memory limit: {}", limits.memory_limit));
    if (!isfinite(limits.cpu_share) || limits.cpu_share <= 0)
        throw sandbox_unavailable(fmt::format("Invalid cpu share: {}", limits.cpu_share));
    if (limits.nproc == 0)
        throw sandbox_unavailable("Invalid process limit: 0");
    if (limits.file_limit <= 0 || limits.stream_size <= 0)
        throw sandbox_unavailable("Invalid file size limit");
}

}  // namespace grader
