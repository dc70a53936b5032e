/**
 * @file command_executor.cpp
 * @brief Implementation of in-container command execution
 *
 * @date 2025
 */

#include "cloister/core/command_executor.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace cloister {
namespace core {

CommandExecutor::CommandExecutor(ContainerManager& manager) : manager_(manager) {
}

ExecutionResult CommandExecutor::Execute(const ExecutionRequest& request) {
    return Execute(request.container_id, request.argv, request.options);
}

ExecutionResult CommandExecutor::Execute(const std::string& container_id,
                                         const std::vector<std::string>& argv,
                                         const ExecutionOptions& options) {
    const auto& config = manager_.Config();
    std::string command_line = utils::StringUtils::Truncate(utils::StringUtils::Join(argv, " "), 256);

    // Preconditions: nothing reaches the runtime unless all hold
    if (argv.empty()) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Command is empty",
                           {{"container_id", container_id}});
    }

    if (!manager_.IsRegistered(container_id)) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Container is not managed by this engine",
                           {{"container_id", container_id}, {"command", command_line}});
    }

    auto timeout = options.timeout.value_or(config.command_timeout);
    if (timeout.count() <= 0) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "Command timeout must be greater than zero",
                           {{"container_id", container_id},
                            {"timeout_ms", std::to_string(timeout.count())}});
    }

    auto state = manager_.Status(container_id);
    if (state != ContainerState::RUNNING) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Container is not running",
                           {{"container_id", container_id},
                            {"state", utils::StateToString(state)},
                            {"command", command_line}});
    }

    utils::ExecSpec spec;
    spec.container_id = container_id;
    spec.argv = argv;
    spec.environment_vars = options.environment_vars;
    spec.working_dir = options.working_dir;
    spec.timeout = timeout;
    spec.max_output_bytes = config.max_output_bytes;

    spdlog::debug("Exec in {}: {}", container_id.substr(0, 12), command_line);

    utils::RuntimeResult result;
    try {
        result = manager_.Runtime().Exec(spec);
    }
    catch (const std::system_error& e) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Runtime client could not be launched",
                           {{"container_id", container_id}, {"command", command_line}},
                           e.what());
    }

    if (result.timed_out) {
        spdlog::warn("Command timed out after {} ms in {}: {}",
                     timeout.count(), container_id.substr(0, 12), command_line);
        throw SandboxError(ErrorKind::COMMAND_TIMEOUT, "Command exceeded its timeout",
                           {{"container_id", container_id},
                            {"command", command_line},
                            {"timeout_ms", std::to_string(timeout.count())}});
    }

    if (result.runtime_error) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Runtime failed to execute command",
                           {{"container_id", container_id}, {"command", command_line}},
                           utils::StringUtils::Trim(result.stderr_output));
    }

    if (result.output_truncated) {
        spdlog::warn("Output of '{}' truncated at {} bytes", command_line, config.max_output_bytes);
    }

    ExecutionResult execution;
    execution.exit_code = result.exit_code;
    execution.stdout_output = std::move(result.stdout_output);
    execution.stderr_output = std::move(result.stderr_output);
    execution.duration = result.duration;
    execution.output_truncated = result.output_truncated;

    spdlog::debug("Exec finished in {} ms with exit code {}",
                  execution.duration.count(), execution.exit_code);
    return execution;
}

} // namespace core
} // namespace cloister
