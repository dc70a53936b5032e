#include "cloister/core/engine_config.hpp"
#include "cloister/core/errors.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace cloister::core;

TEST(ParseMemoryLimitTest, AcceptsSuffixes) {
    EXPECT_EQ(ParseMemoryLimit("512"), 512u);
    EXPECT_EQ(ParseMemoryLimit("512b"), 512u);
    EXPECT_EQ(ParseMemoryLimit("4k"), 4096u);
    EXPECT_EQ(ParseMemoryLimit("256m"), 256ull * 1024 * 1024);
    EXPECT_EQ(ParseMemoryLimit("2G"), 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(ParseMemoryLimit(" 1g "), 1024ull * 1024 * 1024);
}

TEST(ParseMemoryLimitTest, RejectsMalformedValues) {
    for (const auto& bad : {"", "m", "abc", "12x", "-5m", "1.5g", "0m"}) {
        try {
            ParseMemoryLimit(bad);
            FAIL() << "accepted " << bad;
        }
        catch (const SandboxError& e) {
            EXPECT_EQ(e.Kind(), ErrorKind::CONFIGURATION) << bad;
        }
    }
}

TEST(EngineConfigTest, DefaultsAreHardened) {
    EngineConfig config;
    EXPECT_EQ(config.base_image, "ubuntu:latest");
    EXPECT_EQ(config.default_network_mode, "none");
    EXPECT_EQ(config.container_user, "1000:1000");
    EXPECT_DOUBLE_EQ(config.default_resource_limits.cpus, 0.5);
    EXPECT_EQ(config.default_resource_limits.memory_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(config.command_timeout.count(), 30000);
    EXPECT_EQ(config.blocked_extensions.count(".exe"), 1u);
    EXPECT_NO_THROW(ValidateConfig(config));
}

TEST(EngineConfigTest, ParsesJsonOverrides) {
    auto config = ParseConfig(R"({
        "baseImage": "python:3.12-slim",
        "tempHostDir": "/var/tmp/cloister-x",
        "defaultResourceLimits": { "cpus": 1.5, "memory": "1g", "pids": 64 },
        "commandTimeoutMs": 5000,
        "allowedExtensions": ["py", ".TXT"],
        "maxFileCount": 10,
        "logLevel": "debug",
        "someUnknownKey": true
    })");

    EXPECT_EQ(config.base_image, "python:3.12-slim");
    EXPECT_EQ(config.temp_host_dir, "/var/tmp/cloister-x");
    EXPECT_DOUBLE_EQ(config.default_resource_limits.cpus, 1.5);
    EXPECT_EQ(config.default_resource_limits.memory_bytes, 1024ull * 1024 * 1024);
    EXPECT_EQ(config.default_resource_limits.pids, 64);
    EXPECT_EQ(config.command_timeout.count(), 5000);
    EXPECT_EQ(config.allowed_extensions, (std::set<std::string>{".py", ".txt"}));
    EXPECT_EQ(config.max_file_count, 10u);
    EXPECT_EQ(config.log_level, "debug");
    // Untouched keys keep defaults
    EXPECT_EQ(config.git_image, "alpine/git:latest");
}

TEST(EngineConfigTest, RejectsInvalidDocuments) {
    auto expect_config_error = [](const std::string& text) {
        try {
            ParseConfig(text);
            FAIL() << "accepted " << text;
        }
        catch (const SandboxError& e) {
            EXPECT_EQ(e.Kind(), ErrorKind::CONFIGURATION) << text;
        }
    };

    expect_config_error("{ not json");
    expect_config_error("[1, 2]");
    expect_config_error(R"({"defaultResourceLimits": {"memory": "lots"}})");
    expect_config_error(R"({"defaultResourceLimits": {"cpus": 0}})");
    expect_config_error(R"({"defaultNetworkMode": "host"})");
    expect_config_error(R"({"containerUser": "root"})");
    expect_config_error(R"({"containerUser": "root:root"})");
    expect_config_error(R"({"containerUser": "root:1000"})");
    expect_config_error(R"({"containerUser": "0000"})");
    expect_config_error(R"({"containerUser": "0:1000"})");
    expect_config_error(R"({"commandTimeoutMs": 0})");
    expect_config_error(R"({"tempHostDir": "relative/dir"})");
    expect_config_error(R"({"baseImage": 42})");
}

TEST(EngineConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "cloister-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"gitImage": "example/git:2"})";
    }

    auto config = LoadConfig(path);
    EXPECT_EQ(config.git_image, "example/git:2");
    std::filesystem::remove(path);

    EXPECT_THROW(LoadConfig("/nonexistent/cloister.json"), SandboxError);
}
