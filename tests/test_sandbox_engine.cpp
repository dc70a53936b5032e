#include "cloister/core/errors.hpp"
#include "cloister/core/sandbox_engine.hpp"
#include "cloister/utils/string_utils.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace cloister::core;
using namespace std::chrono_literals;
using cloister::testing::FakeRuntimeClient;
using cloister::utils::ExecSpec;

class SandboxEngineTest : public cloister::testing::TempRootTest {};

TEST_F(SandboxEngineTest, StagedPythonScriptRunsAndPrintsOk) {
    runtime_->SetExecHandler([](const ExecSpec& spec) {
        if (spec.argv == std::vector<std::string>{"python", "main.py"}) {
            return FakeRuntimeClient::Ok("ok\n");
        }
        return FakeRuntimeClient::Exit(2, {}, "unexpected command");
    });

    SandboxEngine engine(config_, runtime_);
    auto session = engine.CreateSession();
    auto mounts = engine.PrepareFiles(session, {{"main.py", "print('ok')\n"}});

    ContainerRequest request;
    request.mounts = mounts;
    auto id = engine.CreateAndStartContainer(request);

    auto result = engine.ExecuteCommand(id, {"python", "main.py"});
    EXPECT_EQ(runtime_->CreatedSpecs().front().working_dir, "/workspace");
    EXPECT_FALSE(runtime_->Execs().back().working_dir.has_value());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "ok\n");
    EXPECT_EQ(engine.ContainerStatus(id), ContainerState::RUNNING);
    EXPECT_EQ(engine.StagedFiles(session).size(), 1u);

    EXPECT_TRUE(engine.CleanupContainer(id));
    engine.CleanupSessionDir(session);
    EXPECT_EQ(engine.ActiveContainerCount(), 0u);
    EXPECT_TRUE(engine.ActiveSessions().empty());
}

TEST_F(SandboxEngineTest, AsyncExecutionYieldsResult) {
    runtime_->SetExecHandler([](const ExecSpec&) { return FakeRuntimeClient::Ok("hi\n"); });
    SandboxEngine engine(config_, runtime_);

    auto id = engine.CreateAndStartContainerAsync({}).get();
    auto future = engine.ExecuteCommandAsync(id, {"echo", "hi"});
    EXPECT_EQ(future.get().stdout_output, "hi\n");
}

TEST_F(SandboxEngineTest, AsyncVariantsRethrowTypedErrors) {
    SandboxEngine engine(config_, runtime_);

    auto exec = engine.ExecuteCommandAsync("unknown", {"ls"});
    try {
        exec.get();
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::COMMAND_EXECUTION);
    }

    auto clone = engine.CloneRepositoryAsync("http://insecure.example/repo.git");
    try {
        clone.get();
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::SECURITY_VIOLATION);
    }
}

TEST_F(SandboxEngineTest, RunToolThroughRegistry) {
    runtime_->SetExecHandler([](const ExecSpec&) { return FakeRuntimeClient::Exit(1, "E501\n"); });
    SandboxEngine engine(config_, runtime_);
    auto id = engine.CreateAndStartContainer({});

    auto result = engine.RunTool("flake8", id, "/workspace");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stdout_output, "E501\n");
    EXPECT_THROW(engine.RunTool("unknown-tool", id, "/workspace"), SandboxError);
}

TEST_F(SandboxEngineTest, DestructorReclaimsEverything) {
    std::filesystem::path session;
    {
        SandboxEngine engine(config_, runtime_);
        engine.CreateAndStartContainer({});
        engine.CreateAndStartContainer({});
        session = engine.CreateSession();
        EXPECT_EQ(runtime_->LiveContainers(), 2u);
    }

    EXPECT_EQ(runtime_->LiveContainers(), 0u);
    EXPECT_FALSE(std::filesystem::exists(session));
}

TEST_F(SandboxEngineTest, InvalidConfigurationIsRejected) {
    config_.default_network_mode = "bridge";
    try {
        SandboxEngine engine(config_, runtime_);
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CONFIGURATION);
    }
}

TEST_F(SandboxEngineTest, OrphansAreListedAndReapedOnRequest) {
    SandboxEngine engine(config_, runtime_);
    auto tracked = engine.CreateAndStartContainer({});
    runtime_->AddForeignContainer("old-run");

    auto orphans = engine.FindOrphans();
    ASSERT_EQ(orphans, std::vector<std::string>{"old-run"});
    EXPECT_TRUE(runtime_->Exists("old-run"));

    EXPECT_FALSE(engine.ReapOrphan(tracked));
    EXPECT_TRUE(engine.ReapOrphan("old-run"));
    EXPECT_FALSE(runtime_->Exists("old-run"));
    EXPECT_TRUE(engine.FindOrphans().empty());
}

TEST_F(SandboxEngineTest, ReapRefusesUnlabelledContainers) {
    SandboxEngine engine(config_, runtime_);
    auto foreign = runtime_->CreateContainer(cloister::utils::ContainerBuilder()
                                                 .WithName("users-postgres")
                                                 .WithImage("postgres:16")
                                                 .Build());
    ASSERT_TRUE(foreign.success);
    auto id = cloister::utils::StringUtils::Trim(foreign.stdout_output);

    EXPECT_TRUE(engine.FindOrphans().empty());
    EXPECT_FALSE(engine.ReapOrphan(id));
    EXPECT_TRUE(runtime_->Exists(id));
}
