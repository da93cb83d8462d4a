#include "batch/manifest.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

batch_item parse_manifest_item(const json &j, size_t index, const filesystem::path &base_dir) {
    if (!j.is_object())
        throw config_error(fmt::format("Manifest item {} should be an object", index));

    batch_item item;
    item.index = index;
    execution_request &request = item.request;

    try {
        if (j.count("code")) {
            j.at("code").get_to(request.source);
        } else if (j.count("path")) {
            filesystem::path path = j.at("path").get<string>();
            if (path.is_relative()) path = base_dir / path;
            if (!filesystem::is_regular_file(path))
                throw config_error(fmt::format("Manifest item {}: file {} does not exist", index, path.string()));
            request.source = read_file_content(path);
            item.student = path.stem().string();
        } else {
            throw config_error(fmt::format("Manifest item {} has neither path nor code", index));
        }

        if (j.count("student") && !j.at("student").is_null())
            item.student = j.at("student").get<string>();
        if (j.count("language")) j.at("language").get_to(request.language);
        if (j.count("stdin") && !j.at("stdin").is_null())
            request.stdin_data = j.at("stdin").get<string>();
        if (j.count("timeout") && !j.at("timeout").is_null())
            request.timeout = j.at("timeout").get<double>();
        if (j.count("memory_limit") && !j.at("memory_limit").is_null()) {
            auto &memory = j.at("memory_limit");
            request.memory_limit = memory.is_string() ? parse_memory_size(memory.get<string>()) : memory.get<int64_t>();
        }

        if (j.count("test_framework"))
            request.style = parse_test_style(j.at("test_framework").get<string>());

        if (j.count("test_code") && !j.at("test_code").is_null())
            request.tests = j.at("test_code").get<string>();
        else if (j.count("tests") && !j.at("tests").is_null())
            request.tests = j.at("tests").get<vector<test_case>>();
    } catch (json::exception &e) {
        throw config_error(fmt::format("Manifest item {} is malformed: {}", index, e.what()));
    } catch (invalid_argument &e) {
        throw config_error(fmt::format("Manifest item {}: {}", index, e.what()));
    }
    return item;
}

vector<batch_item> load_manifest(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw config_error("Manifest file " + path.string() + " does not exist");

    json j = json::parse(read_file_content(path), nullptr, false);
    if (j.is_discarded() || !j.is_array())
        throw config_error("Manifest file " + path.string() + " should be a JSON array");

    vector<batch_item> items;
    for (size_t i = 0; i < j.size(); ++i)
        items.push_back(parse_manifest_item(j[i], i, path.parent_path()));
    return items;
}

}  // namespace grader
