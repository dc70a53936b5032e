#include "cloister/utils/process_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace cloister::utils;
using namespace std::chrono_literals;

TEST(RunProcessTest, CapturesStreamsSeparately) {
    auto result = RunProcess({"sh", "-c", "printf out; printf err >&2; exit 3"});

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out");
    EXPECT_EQ(result.stderr_output, "err");
    EXPECT_FALSE(result.timed_out);
}

TEST(RunProcessTest, ArgumentsAreNotShellInterpreted) {
    auto result = RunProcess({"echo", "$HOME; rm -rf /"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "$HOME; rm -rf /\n");
}

TEST(RunProcessTest, DeadlineKillsChild) {
    ProcessOptions options;
    options.timeout = 100ms;

    auto result = RunProcess({"sleep", "5"}, options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration, 3000ms);
}

TEST(RunProcessTest, DeadlineHoldsAfterStreamsClose) {
    ProcessOptions options;
    options.timeout = 200ms;

    auto result = RunProcess({"sh", "-c", "exec >&- 2>&-; sleep 3"}, options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration, 2000ms);
}

TEST(RunProcessTest, OutputIsCappedPerStream) {
    ProcessOptions options;
    options.max_output_bytes = 1000;

    auto result = RunProcess({"sh", "-c", "head -c 100000 /dev/zero"}, options);

    EXPECT_EQ(result.stdout_output.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(RunProcessTest, MissingBinaryExitsWith127) {
    auto result = RunProcess({"cloister-definitely-not-a-binary"});
    EXPECT_EQ(result.exit_code, 127);
}

TEST(RunProcessTest, EmptyArgvThrows) {
    EXPECT_THROW(RunProcess({}), std::invalid_argument);
}
