#include <unistd.h>
#include "batch/manifest.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace grader;
using nlohmann::json;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test_run_dir() / ("config-" + to_string(getpid()));
        filesystem::create_directories(dir);
    }

    void TearDown() override {
        filesystem::remove_all(dir);
    }

    filesystem::path dir;
};

TEST_F(ConfigTest, MemorySizeTest) {
    EXPECT_EQ(parse_memory_size("128m"), 128ll << 20);
    EXPECT_EQ(parse_memory_size("128M"), 128ll << 20);
    EXPECT_EQ(parse_memory_size("64k"), 64ll << 10);
    EXPECT_EQ(parse_memory_size("2g"), 2ll << 30);
    EXPECT_EQ(parse_memory_size("4096"), 4096);
    EXPECT_THROW(parse_memory_size(""), config_error);
    EXPECT_THROW(parse_memory_size("lots"), config_error);
    EXPECT_THROW(parse_memory_size("-5m"), config_error);
}

TEST_F(ConfigTest, DefaultsTest) {
    grader_config config;
    EXPECT_DOUBLE_EQ(config.timeout, 30);
    EXPECT_EQ(config.memory_limit, 128ll << 20);
    EXPECT_EQ(config.max_concurrent, 5);
    EXPECT_EQ(config.max_batch_size, 100);
    EXPECT_FALSE(config.deny_patterns.empty());
    EXPECT_NO_THROW(check_config(config));
}

TEST_F(ConfigTest, LoadConfigTest) {
    write_file_content(dir / "config.json", R"({
        "timeout": 5,
        "memory_limit": "64m",
        "max_concurrent": 2,
        "risks_fatal": true,
        "cgroup": false,
        "deny_patterns": [{"label": "Reads input", "pattern": "input(", "kind": "substring"}]
    })");

    grader_config config = load_config(dir / "config.json");
    EXPECT_DOUBLE_EQ(config.timeout, 5);
    EXPECT_EQ(config.memory_limit, 64ll << 20);
    EXPECT_EQ(config.max_concurrent, 2);
    EXPECT_TRUE(config.risks_fatal);
    EXPECT_FALSE(config.use_cgroup);
    ASSERT_EQ(config.deny_patterns.size(), 1);
    EXPECT_EQ(config.deny_patterns[0].label, "Reads input");
    EXPECT_EQ(config.max_batch_size, 100);
}

TEST_F(ConfigTest, MalformedConfigTest) {
    write_file_content(dir / "broken.json", "{\"timeout\": ");
    EXPECT_THROW(load_config(dir / "broken.json"), config_error);
    EXPECT_THROW(load_config(dir / "missing.json"), config_error);
}

TEST_F(ConfigTest, CheckConfigTest) {
    grader_config config;
    config.max_concurrent = 0;
    EXPECT_THROW(check_config(config), config_error);

    config = grader_config();
    config.timeout = -1;
    EXPECT_THROW(check_config(config), config_error);
}

TEST_F(ConfigTest, ManifestTest) {
    write_file_content(dir / "alice.py", "def add(a, b):\n    return a + b\n");
    write_file_content(dir / "manifest.json", R"json([
        {"path": "alice.py", "tests": [{"function": "add", "inputs": [1, 2], "expected": 3}], "timeout": 3},
        {"code": "print(input())", "student": "bob", "stdin": "hi", "memory_limit": "32m"},
        {"code": "x = 1", "test_code": "def test_x(): pass", "test_framework": "unittest"}
    ])json");

    auto items = load_manifest(dir / "manifest.json");
    ASSERT_EQ(items.size(), 3);

    EXPECT_EQ(items[0].index, 0);
    EXPECT_EQ(items[0].student, "alice");
    EXPECT_EQ(items[0].request.source, "def add(a, b):\n    return a + b\n");
    ASSERT_TRUE(items[0].request.tests);
    EXPECT_EQ(get<vector<test_case>>(*items[0].request.tests).size(), 1);
    EXPECT_EQ(items[0].request.timeout, 3.0);

    EXPECT_EQ(items[1].student, "bob");
    EXPECT_EQ(items[1].request.stdin_data, "hi");
    EXPECT_EQ(items[1].request.memory_limit, 32ll << 20);
    EXPECT_FALSE(items[1].request.tests);

    EXPECT_EQ(items[2].request.style, test_style::UNITTEST);
    ASSERT_TRUE(items[2].request.tests);
    EXPECT_EQ(get<string>(*items[2].request.tests), "def test_x(): pass");
}

TEST_F(ConfigTest, MalformedManifestTest) {
    EXPECT_THROW(parse_manifest_item(json::parse(R"({"student": "x"})"), 0, dir), config_error);
    EXPECT_THROW(parse_manifest_item(json::parse(R"({"path": "nope.py"})"), 0, dir), config_error);
    EXPECT_THROW(parse_manifest_item(json::parse(R"({"code": "x", "test_framework": "nose"})"), 0, dir), config_error);
    EXPECT_THROW(parse_manifest_item(json::parse(R"({"code": 5})"), 0, dir), config_error);
    EXPECT_THROW(parse_manifest_item(json::parse(R"json({"code": "x", "tests": [{"function": "f(); exit()"}]})json"), 0, dir),
                 config_error);

    write_file_content(dir / "object.json", "{}");
    EXPECT_THROW(load_manifest(dir / "object.json"), config_error);
}
