#include "cloister/core/container_manager.hpp"
#include "cloister/core/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace cloister::core;
using cloister::testing::FakeRuntimeClient;

class ContainerManagerTest : public cloister::testing::TempRootTest {};

TEST_F(ContainerManagerTest, CreatesHardenedRunningContainer) {
    ContainerManager manager(config_, runtime_);

    ContainerRequest request;
    request.mounts = {MountSpec{"/tmp/x/main.py", "/workspace/main.py", true}};
    auto id = manager.CreateAndStart(request);

    EXPECT_TRUE(manager.IsRegistered(id));
    auto record = manager.GetRecord(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, ContainerState::RUNNING);
    EXPECT_EQ(record->image, "python:3.12-slim");

    auto specs = runtime_->CreatedSpecs();
    ASSERT_EQ(specs.size(), 1u);
    const auto& spec = specs.front();
    EXPECT_EQ(spec.network_mode, NetworkMode::NONE);
    EXPECT_EQ(spec.user, "1000:1000");
    EXPECT_EQ(spec.capabilities_drop, std::vector<std::string>{"ALL"});
    EXPECT_TRUE(spec.no_new_privileges);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_DOUBLE_EQ(spec.cpu_limit, 0.5);
    EXPECT_EQ(spec.memory_limit_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(spec.labels.at("cloister.managed"), "true");
    EXPECT_EQ(spec.mounts.size(), 1u);
    EXPECT_EQ(spec.entrypoint.front(), "tail");
}

TEST_F(ContainerManagerTest, PullsMissingImage) {
    ContainerManager manager(config_, runtime_);

    ContainerRequest request;
    request.image = "node:20-slim";
    EXPECT_NO_THROW(manager.CreateAndStart(request));
    EXPECT_EQ(runtime_->pulls(), 1);
}

TEST_F(ContainerManagerTest, FailedPullIsContainerCreationError) {
    runtime_->SetPullResult(FakeRuntimeClient::Exit(1, {}, "manifest unknown"));
    ContainerManager manager(config_, runtime_);

    ContainerRequest request;
    request.image = "does/not:exist";
    try {
        manager.CreateAndStart(request);
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CONTAINER_CREATION);
        EXPECT_EQ(e.Cause(), "manifest unknown");
    }
    EXPECT_EQ(manager.ActiveCount(), 0u);
}

TEST_F(ContainerManagerTest, CreateFailureCarriesRuntimeCause) {
    runtime_->FailNextCreate("Error response from daemon: Conflict");
    ContainerManager manager(config_, runtime_);

    try {
        manager.CreateAndStart({});
        FAIL();
    }
    catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::CONTAINER_CREATION);
        EXPECT_NE(e.Cause().find("Conflict"), std::string::npos);
    }
}

TEST_F(ContainerManagerTest, StartFailureRemovesHalfCreatedContainer) {
    runtime_->FailNextStart("OCI runtime create failed");
    ContainerManager manager(config_, runtime_);

    EXPECT_THROW(manager.CreateAndStart({}), SandboxError);
    EXPECT_EQ(manager.ActiveCount(), 0u);
    EXPECT_EQ(runtime_->LiveContainers(), 0u);
}

TEST_F(ContainerManagerTest, StartFailureKeepsFailedRecordWhenRemovalFails) {
    runtime_->FailNextStart("OCI runtime create failed");
    runtime_->FailRemove(true);
    ContainerManager manager(config_, runtime_);

    EXPECT_THROW(manager.CreateAndStart({}), SandboxError);
    ASSERT_EQ(manager.ActiveCount(), 1u);
    auto record = manager.GetRecord(manager.ActiveContainerIds().front());
    EXPECT_EQ(record->state, ContainerState::FAILED);
}

TEST_F(ContainerManagerTest, NonPositiveLimitsAreResourceLimitErrors) {
    ContainerManager manager(config_, runtime_);

    for (auto limits : {ResourceLimits{0.0, 1024, 10}, ResourceLimits{1.0, 0, 10},
                        ResourceLimits{1.0, 1024, 0}}) {
        ContainerRequest request;
        request.limits = limits;
        try {
            manager.CreateAndStart(request);
            FAIL();
        }
        catch (const SandboxError& e) {
            EXPECT_EQ(e.Kind(), ErrorKind::RESOURCE_LIMIT);
        }
    }
    EXPECT_TRUE(runtime_->CreatedSpecs().empty());
}

TEST_F(ContainerManagerTest, NetworkOverrideIsApplied) {
    ContainerManager manager(config_, runtime_);

    ContainerRequest request;
    request.network_override = NetworkOverride{NetworkMode::BRIDGE, "repository clone"};
    manager.CreateAndStart(request);

    EXPECT_EQ(runtime_->CreatedSpecs().front().network_mode, NetworkMode::BRIDGE);
}

TEST_F(ContainerManagerTest, StatusReflectsRuntime) {
    ContainerManager manager(config_, runtime_);
    auto id = manager.CreateAndStart({});

    EXPECT_EQ(manager.Status(id), ContainerState::RUNNING);
    runtime_->SetState(id, ContainerState::STOPPED);
    EXPECT_EQ(manager.Status(id), ContainerState::STOPPED);
    EXPECT_EQ(manager.GetRecord(id)->state, ContainerState::STOPPED);
    EXPECT_EQ(manager.Status("unknown-id"), ContainerState::REMOVED);
}

TEST_F(ContainerManagerTest, StopAndRemoveTolerateMissingContainers) {
    ContainerManager manager(config_, runtime_);
    EXPECT_TRUE(manager.Stop("gone"));
    EXPECT_TRUE(manager.Remove("gone"));
}

TEST_F(ContainerManagerTest, FindOrphansExcludesTrackedContainers) {
    ContainerManager manager(config_, runtime_);
    auto tracked = manager.CreateAndStart({});
    runtime_->AddForeignContainer("leftover-1");

    auto orphans = manager.FindOrphans();
    ASSERT_EQ(orphans.size(), 1u);
    EXPECT_EQ(orphans.front(), "leftover-1");
    EXPECT_TRUE(runtime_->Exists("leftover-1"));
    EXPECT_NE(orphans.front(), tracked);
}
