/**
 * @file process_utils.hpp
 * @brief Host process execution with separated output capture and deadlines
 *
 * Runs a host binary by argv (never through a shell), captures stdout and
 * stderr on independent pipes, and enforces a wall-clock deadline by killing
 * the child's process group. This is the transport underneath the Docker CLI
 * runtime client.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cloister {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Limits applied to a single host process run
 */
struct ProcessOptions {
    std::chrono::milliseconds timeout{0};           ///< Deadline (0 = wait forever)
    std::size_t max_output_bytes{10 * 1024 * 1024}; ///< Per-stream capture cap
};

/**
 * @struct ProcessResult
 * @brief Outcome of a host process run
 *
 * On timeout the captured streams hold whatever was read before the kill.
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, or 128+signal
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Deadline expired and child was killed
    bool stdout_truncated{false};           ///< Stdout exceeded max_output_bytes
    bool stderr_truncated{false};           ///< Stderr exceeded max_output_bytes
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime
};

/**
 * @brief Run a process and wait for it, honouring the deadline
 *
 * The child is placed in its own process group so that a timeout kills
 * everything it spawned. Exit code 127 is reported when the binary cannot
 * be executed.
 *
 * @param argv Program and arguments; argv[0] is looked up on PATH
 * @param options Deadline and capture limits
 * @return Process result
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes cannot be created or fork fails
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

} // namespace utils
} // namespace cloister
