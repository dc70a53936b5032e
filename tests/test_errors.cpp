#include "cloister/core/errors.hpp"

#include <gtest/gtest.h>

using namespace cloister::core;

TEST(SandboxErrorTest, WhatCarriesCodeMessageAndCause) {
    SandboxError error(ErrorKind::COMMAND_TIMEOUT, "Command exceeded its timeout",
                       {{"container_id", "abc"}}, "deadline 100 ms");

    std::string what = error.what();
    EXPECT_NE(what.find("COMMAND_TIMEOUT_ERROR"), std::string::npos);
    EXPECT_NE(what.find("Command exceeded its timeout"), std::string::npos);
    EXPECT_NE(what.find("deadline 100 ms"), std::string::npos);
    EXPECT_EQ(error.Context().at("container_id"), "abc");
    EXPECT_EQ(error.Kind(), ErrorKind::COMMAND_TIMEOUT);
}

TEST(SandboxErrorTest, CodesPerKind) {
    EXPECT_EQ(ErrorCode(ErrorKind::CONTAINER_CREATION), "CONTAINER_CREATION_ERROR");
    EXPECT_EQ(ErrorCode(ErrorKind::COMMAND_EXECUTION), "COMMAND_EXECUTION_ERROR");
    EXPECT_EQ(ErrorCode(ErrorKind::FILE_SYSTEM), "FILE_SYSTEM_ERROR");
    EXPECT_EQ(ErrorCode(ErrorKind::SECURITY_VIOLATION), "SECURITY_VIOLATION_ERROR");
    EXPECT_EQ(ErrorCode(ErrorKind::RESOURCE_LIMIT), "RESOURCE_LIMIT_ERROR");
    EXPECT_EQ(ErrorCode(ErrorKind::CONFIGURATION), "SANDBOX_GENERIC");
}

TEST(ClassifyErrorTest, SecurityViolationIsFatalAndHalts) {
    SandboxError error(ErrorKind::SECURITY_VIOLATION, "Path escapes the session directory");
    auto c = ClassifyError(error);

    EXPECT_EQ(c.severity, Severity::FATAL);
    EXPECT_EQ(c.suggested_action, SuggestedAction::HALT);
    EXPECT_FALSE(c.is_retryable);
    EXPECT_EQ(c.details, "Security violation: Path escapes the session directory");
}

TEST(ClassifyErrorTest, TimeoutIsRecoverableWithModification) {
    auto c = ClassifyError(SandboxError(ErrorKind::COMMAND_TIMEOUT, "slow"));
    EXPECT_EQ(c.severity, Severity::RECOVERABLE_WITH_MODIFICATION);
    EXPECT_EQ(c.suggested_action, SuggestedAction::RETRY_SUBTASK_MODIFIED);
    EXPECT_TRUE(c.is_retryable);
}

TEST(ClassifyErrorTest, CommandExecutionIsCriticalButRetryable) {
    auto c = ClassifyError(SandboxError(ErrorKind::COMMAND_EXECUTION, "dead container"));
    EXPECT_EQ(c.severity, Severity::CRITICAL);
    EXPECT_EQ(c.suggested_action, SuggestedAction::RETRY_SUBTASK_MODIFIED);
}

TEST(ClassifyErrorTest, ContainerCreationHalts) {
    auto c = ClassifyError(SandboxError(ErrorKind::CONTAINER_CREATION, "no image"));
    EXPECT_EQ(c.severity, Severity::CRITICAL);
    EXPECT_EQ(c.suggested_action, SuggestedAction::HALT);
}

TEST(ClassifyErrorTest, OptionalTaskDowngradesCritical) {
    auto c = ClassifyError(SandboxError(ErrorKind::FILE_SYSTEM, "disk"), true);
    EXPECT_EQ(c.severity, Severity::WARNING);
    EXPECT_EQ(c.suggested_action, SuggestedAction::LOG_AND_CONTINUE);

    // Fatal errors are never downgraded
    auto fatal = ClassifyError(SandboxError(ErrorKind::SECURITY_VIOLATION, "escape"), true);
    EXPECT_EQ(fatal.severity, Severity::FATAL);
}

TEST(ClassifyErrorTest, ForeignExceptionIsUnclassified) {
    std::runtime_error error("boom");
    auto c = ClassifyError(error);
    EXPECT_EQ(c.severity, Severity::CRITICAL);
    EXPECT_EQ(c.suggested_action, SuggestedAction::HALT);
    EXPECT_EQ(c.details, "Unclassified error: boom");
}

TEST(ClassifyErrorTest, SandboxErrorThroughBaseReferenceKeepsKind) {
    SandboxError error(ErrorKind::RESOURCE_LIMIT, "too big");
    const std::exception& base = error;
    EXPECT_EQ(ClassifyError(base).severity, Severity::RECOVERABLE_WITH_MODIFICATION);
}

TEST(FormatContextTest, RendersSortedPairs) {
    EXPECT_EQ(FormatContext({{"path", "/x"}, {"container_id", "c1"}}), "container_id=c1, path=/x");
    EXPECT_EQ(FormatContext({}), "");
}
