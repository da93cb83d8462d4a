#include "sandbox/runguard_meta.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace grader {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t sep = line.find(": ");
        if (sep == string::npos) {
            // "key:" 后面没有值
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, sep)] = line.substr(sep + 2);
    }
    return mp;
}

template <typename T>
static bool try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return false;
    try {
        value = boost::lexical_cast<T>(it->second);
        return true;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    result.complete = try_to_parse(metadata, "exitcode", result.exitcode);

    int signal;
    if (try_to_parse(metadata, "signal", signal)) result.signal = signal;

    int64_t memory;
    if (try_to_parse(metadata, "memory-bytes", memory) && memory >= 0) result.memory = memory;

    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    return result;
}

}  // namespace grader
