/**
 * Runs against a real Docker daemon. Every test skips when the daemon or
 * the required image is unavailable.
 */

#include "cloister/core/errors.hpp"
#include "cloister/core/sandbox_engine.hpp"
#include "cloister/utils/container_utils.hpp"
#include "cloister/utils/hash_utils.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace cloister::core;
using namespace std::chrono_literals;

class DockerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::warn);
        docker_ = std::make_shared<cloister::utils::DockerCliClient>();
        if (!docker_->IsAvailable()) {
            GTEST_SKIP() << "Docker daemon not available";
        }
        config_.temp_host_dir = std::filesystem::temp_directory_path() /
                                ("cloister-it-" + cloister::utils::HashUtils::RandomHex(4));
        config_.pull_missing_images = false;
    }

    void RequireImage(const std::string& image) {
        if (!docker_->ImageExists(image)) {
            GTEST_SKIP() << "Image not present locally: " << image;
        }
        config_.base_image = image;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(config_.temp_host_dir, ec);
    }

    std::shared_ptr<cloister::utils::DockerCliClient> docker_;
    EngineConfig config_;
};

TEST_F(DockerIntegrationTest, EchoReturnsExactOutput) {
    RequireImage("alpine:latest");
    SandboxEngine engine(config_, docker_);

    auto id = engine.CreateAndStartContainer({});
    auto result = engine.ExecuteCommand(id, {"echo", "hello sandbox"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello sandbox\n");
    EXPECT_EQ(result.stderr_output, "");
    EXPECT_TRUE(engine.CleanupContainer(id));
}

TEST_F(DockerIntegrationTest, ContainerIsIsolated) {
    RequireImage("alpine:latest");
    SandboxEngine engine(config_, docker_);
    auto id = engine.CreateAndStartContainer({});

    EXPECT_EQ(engine.ExecuteCommand(id, {"id", "-u"}).stdout_output, "1000\n");
    EXPECT_NE(engine.ExecuteCommand(id, {"touch", "/etc/owned"}).exit_code, 0);
    EXPECT_NE(engine.ExecuteCommand(id, {"wget", "-q", "-T", "2", "http://example.com"}).exit_code, 0);
}

TEST_F(DockerIntegrationTest, TimeoutKillsCommandButKeepsContainer) {
    RequireImage("alpine:latest");
    SandboxEngine engine(config_, docker_);
    auto id = engine.CreateAndStartContainer({});

    ExecutionOptions options;
    options.timeout = 100ms;
    try {
        engine.ExecuteCommand(id, {"sleep", "30"}, options);
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::COMMAND_TIMEOUT);
    }

    EXPECT_TRUE(engine.IsRegistered(id));
    EXPECT_EQ(engine.ContainerStatus(id), ContainerState::RUNNING);
    EXPECT_EQ(engine.ExecuteCommand(id, {"true"}).exit_code, 0);
    EXPECT_TRUE(engine.CleanupContainer(id));
    EXPECT_FALSE(engine.IsRegistered(id));
}

TEST_F(DockerIntegrationTest, PythonScriptPrintsOk) {
    RequireImage("python:3.12-slim");
    SandboxEngine engine(config_, docker_);

    auto session = engine.CreateSession();
    ContainerRequest request;
    request.mounts = engine.PrepareFiles(session, {{"main.py", "print('ok')\n"}});
    auto id = engine.CreateAndStartContainer(request);

    auto result = engine.ExecuteCommand(id, {"python", "main.py"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "ok\n");

    auto report = engine.CleanupAll();
    EXPECT_TRUE(report.Clean());
    EXPECT_FALSE(std::filesystem::exists(session));
}
