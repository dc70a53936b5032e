/**
 * @file command_executor.hpp
 * @brief Command execution inside running sandbox containers
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/container_manager.hpp"
#include "cloister/core/types.hpp"

#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class CommandExecutor
 * @brief Runs argv in a registered container with a deadline
 *
 * Execution blocks the caller until the command finishes or its timeout
 * elapses. On timeout the process inside the container is killed, the
 * container stays registered and running, and CommandTimeout is raised.
 *
 * @note Concurrent execs against the same container are not serialized.
 */
class CommandExecutor {
public:
    explicit CommandExecutor(ContainerManager& manager);

    /**
     * @brief Execute a command
     *
     * @param container_id Registered container id
     * @param argv Program and arguments (never passed through a shell)
     * @param options Timeout, environment and working directory overrides
     * @return Exit code, stdout, stderr and duration, verbatim
     *
     * @throws SandboxError(COMMAND_EXECUTION) on empty argv, unknown or
     *         non-running container, or a runtime failure
     * @throws SandboxError(RESOURCE_LIMIT) on a non-positive timeout
     * @throws SandboxError(COMMAND_TIMEOUT) when the deadline expires
     */
    ExecutionResult Execute(const std::string& container_id,
                            const std::vector<std::string>& argv,
                            const ExecutionOptions& options = {});

    /// Convenience overload taking a full request
    ExecutionResult Execute(const ExecutionRequest& request);

private:
    ContainerManager& manager_;
};

} // namespace core
} // namespace cloister
