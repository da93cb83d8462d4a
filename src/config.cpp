#include "config.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

int64_t parse_memory_size(const string &text) {
    string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
    if (value.empty()) throw config_error("Empty memory size");

    int64_t multiplier = 1;
    switch (value.back()) {
        case 'k': multiplier = 1ll << 10; break;
        case 'm': multiplier = 1ll << 20; break;
        case 'g': multiplier = 1ll << 30; break;
    }
    if (multiplier != 1) value.pop_back();

    try {
        int64_t amount = boost::lexical_cast<int64_t>(value);
        if (amount <= 0 || amount > INT64_MAX / multiplier)
            throw config_error("Memory size out of range: " + text);
        return amount * multiplier;
    } catch (boost::bad_lexical_cast &) {
        throw config_error("Malformed memory size: " + text);
    }
}

static int64_t memory_field(const json &j) {
    if (j.is_string()) return parse_memory_size(j.get<string>());
    if (j.is_number_integer()) return j.get<int64_t>();
    throw config_error("Memory size should be an integer or a string like \"128m\"");
}

void from_json(const json &j, grader_config &config) {
    if (j.count("timeout")) j.at("timeout").get_to(config.timeout);
    if (j.count("memory_limit")) config.memory_limit = memory_field(j.at("memory_limit"));
    if (j.count("cpu_share")) j.at("cpu_share").get_to(config.cpu_share);
    if (j.count("nproc")) j.at("nproc").get_to(config.nproc);
    if (j.count("file_limit")) config.file_limit = memory_field(j.at("file_limit"));
    if (j.count("stream_size")) config.stream_size = memory_field(j.at("stream_size"));
    if (j.count("max_concurrent")) j.at("max_concurrent").get_to(config.max_concurrent);
    if (j.count("max_batch_size")) j.at("max_batch_size").get_to(config.max_batch_size);
    if (j.count("max_source_size")) j.at("max_source_size").get_to(config.max_source_size);
    if (j.count("sequential")) j.at("sequential").get_to(config.sequential);
    if (j.count("risks_fatal")) j.at("risks_fatal").get_to(config.risks_fatal);
    if (j.count("deny_patterns")) j.at("deny_patterns").get_to(config.deny_patterns);
    if (j.count("run_dir")) config.run_dir = j.at("run_dir").get<string>();
    if (j.count("runguard")) config.runguard = j.at("runguard").get<string>();
    if (j.count("python")) j.at("python").get_to(config.python);
    if (j.count("run_user")) j.at("run_user").get_to(config.run_user);
    if (j.count("run_group")) j.at("run_group").get_to(config.run_group);
    if (j.count("isolate")) j.at("isolate").get_to(config.isolate);
    if (j.count("cgroup")) j.at("cgroup").get_to(config.use_cgroup);
    if (j.count("debug")) j.at("debug").get_to(config.debug);
}

void to_json(json &j, const grader_config &config) {
    j = {{"timeout", config.timeout},
         {"memory_limit", config.memory_limit},
         {"cpu_share", config.cpu_share},
         {"nproc", config.nproc},
         {"file_limit", config.file_limit},
         {"stream_size", config.stream_size},
         {"max_concurrent", config.max_concurrent},
         {"max_batch_size", config.max_batch_size},
         {"max_source_size", config.max_source_size},
         {"sequential", config.sequential},
         {"risks_fatal", config.risks_fatal},
         {"deny_patterns", config.deny_patterns.size()},
         {"run_dir", config.run_dir.string()},
         {"runguard", config.runguard.string()},
         {"python", config.python},
         {"run_user", config.run_user},
         {"run_group", config.run_group},
         {"isolate", config.isolate},
         {"cgroup", config.use_cgroup},
         {"debug", config.debug}};
}

grader_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw config_error("Configuration file " + path.string() + " does not exist");

    grader_config config;
    try {
        json::parse(read_file_content(path)).get_to(config);
    } catch (json::exception &e) {
        throw config_error(fmt::format("Configuration file {} is malformed: {}", path.string(), e.what()));
    }
    return config;
}

void check_config(const grader_config &config) {
    if (!isfinite(config.timeout) || config.timeout <= 0)
        throw config_error(fmt::format("timeout should be positive, got {}", config.timeout));
    if (config.memory_limit <= 0)
        throw config_error("memory_limit should be positive");
    if (!isfinite(config.cpu_share) || config.cpu_share <= 0)
        throw config_error(fmt::format("cpu_share should be positive, got {}", config.cpu_share));
    if (config.max_concurrent == 0)
        throw config_error("max_concurrent should be at least 1");
    if (config.max_batch_size == 0)
        throw config_error("max_batch_size should be at least 1");
    if (config.nproc == 0)
        throw config_error("nproc should be at least 1");
    if (config.file_limit <= 0 || config.stream_size <= 0)
        throw config_error("file_limit and stream_size should be positive");
}

}  // namespace grader
