/**
 * @file container_utils.cpp
 * @brief Implementation of the Docker CLI runtime client
 *
 * **Security Hardening Layers** (rendered by BuildCreateArgs):
 * 1. Network Isolation: --network none unless the spec overrides it
 * 2. Capability Dropping: --cap-drop ALL
 * 3. No New Privileges: --security-opt no-new-privileges
 * 4. Non-root User: --user uid:gid
 * 5. Read-only Rootfs: --read-only plus a small nosuid tmpfs on /tmp
 * 6. Resource Limits: --memory (swap pinned to memory), --cpus, --pids-limit
 *
 * **Container Lifecycle**:
 * ```
 * create → start (keep-alive entrypoint) → exec* → stop → rm
 * ```
 *
 * @date 2025
 */

#include "cloister/utils/container_utils.hpp"
#include "cloister/utils/hash_utils.hpp"
#include "cloister/utils/process_utils.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cloister {
namespace utils {

namespace {

constexpr const char* kExecWrapper = "echo $$ >&2; exec \"$@\"";
constexpr const char* kExecArgv0 = "cloister-exec";

} // anonymous namespace

// ============================================================================
// MOUNT SPEC
// ============================================================================

std::string MountSpec::ToDockerArg() const {
    std::string arg = host_path.string() + ":" + container_path.string();
    if (read_only) {
        arg += ":ro";
    }
    return arg;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCliClient::DockerCliClient(std::string docker_binary,
                                 std::chrono::seconds command_timeout)
    : docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout) {
    spdlog::debug("Docker CLI client using binary: {}", docker_binary_);
}

bool DockerCliClient::IsAvailable() const {
    try {
        auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                           std::chrono::seconds(10));
        if (result.success) {
            spdlog::info("Docker daemon version: {}", StringUtils::Trim(result.stdout_output));
        }
        return result.success;
    }
    catch (const std::exception& e) {
        spdlog::warn("Docker availability check failed: {}", e.what());
        return false;
    }
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerCliClient::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image},
                                       command_timeout_);
    return result.success;
}

RuntimeResult DockerCliClient::PullImage(const std::string& image) {
    spdlog::info("Pulling image: {}", image);

    // Pulls can legitimately take far longer than other runtime calls
    auto result = ExecuteDockerCommand({"pull", "--quiet", image}, command_timeout_ * 5);

    if (result.success) {
        spdlog::info("Image pulled: {}", image);
    } else {
        spdlog::error("Failed to pull image {}: {}", image, StringUtils::Trim(result.stderr_output));
    }
    return result;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

RuntimeResult DockerCliClient::CreateContainer(const ContainerSpec& spec) {
    spdlog::info("Creating container: {} (image: {})", spec.name, spec.image);

    auto result = ExecuteDockerCommand(BuildCreateArgs(spec), command_timeout_);
    if (result.success) {
        result.stdout_output = StringUtils::Trim(result.stdout_output);
        spdlog::info("Container created: {}", result.stdout_output.substr(0, 12));
    } else {
        spdlog::error("Failed to create container: {}", StringUtils::Trim(result.stderr_output));
    }
    return result;
}

RuntimeResult DockerCliClient::StartContainer(const std::string& container_id) {
    spdlog::info("Starting container: {}", container_id);

    auto result = ExecuteDockerCommand({"start", container_id}, command_timeout_);
    if (!result.success) {
        spdlog::error("Failed to start container: {}", StringUtils::Trim(result.stderr_output));
    }
    return result;
}

RuntimeResult DockerCliClient::StopContainer(const std::string& container_id,
                                             std::chrono::seconds grace) {
    spdlog::info("Stopping container: {} (timeout: {}s)", container_id, grace.count());

    return ExecuteDockerCommand({"stop", "--time", std::to_string(grace.count()), container_id},
                                command_timeout_ + grace);
}

RuntimeResult DockerCliClient::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    return ExecuteDockerCommand(args, command_timeout_);
}

std::optional<ContainerState> DockerCliClient::InspectState(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"inspect", "--type", "container", container_id},
                                       command_timeout_);

    if (!result.success) {
        if (result.not_found) {
            return std::nullopt;
        }
        spdlog::warn("Inspect failed for {}: {}", container_id,
                     StringUtils::Trim(result.stderr_output));
        return ContainerState::UNKNOWN;
    }

    try {
        return ParseInspectState(result.stdout_output);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
        return ContainerState::UNKNOWN;
    }
}

std::vector<std::string> DockerCliClient::ListContainers(const std::string& label) {
    auto result = ExecuteDockerCommand(
        {"ps", "--all", "--no-trunc", "--filter", "label=" + label, "--format", "{{.ID}}"},
        command_timeout_);

    if (!result.success) {
        spdlog::warn("Failed to list containers: {}", StringUtils::Trim(result.stderr_output));
        return {};
    }
    return StringUtils::SplitLines(result.stdout_output);
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================
// Execs are wrapped so the in-container PID is known for timeout kills

RuntimeResult DockerCliClient::Exec(const ExecSpec& spec) {
    auto result = ExecuteDockerCommand(BuildExecArgs(spec), spec.timeout, spec.max_output_bytes);

    auto pid = StripExecPidLine(result.stderr_output);

    if (result.timed_out) {
        spdlog::warn("Exec in {} exceeded {} ms", spec.container_id, spec.timeout.count());
        if (pid) {
            KillExecProcess(spec.container_id, *pid);
        } else {
            spdlog::warn("No in-container PID captured; only the exec client was killed");
        }
        return result;
    }

    // No PID line means the wrapper shell never ran: the runtime refused the exec
    if (!pid && result.exit_code != 0) {
        result.runtime_error = true;
    }
    return result;
}

void DockerCliClient::KillExecProcess(const std::string& container_id, long pid) const {
    spdlog::info("Killing exec'd process {} in container {}", pid, container_id);

    auto result = ExecuteDockerCommand(
        {"exec", container_id, "sh", "-c", "kill -KILL \"$1\"", "cloister-kill", std::to_string(pid)},
        std::chrono::seconds(10));

    if (!result.success) {
        spdlog::warn("Kill of pid {} in {} reported: {}", pid, container_id,
                     StringUtils::Trim(result.stderr_output));
    }
}

// ============================================================================
// ARGUMENT CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerCliClient::BuildCreateArgs(const ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Network mode
    args.push_back("--network");
    args.push_back(NetworkModeToString(spec.network_mode));

    // User
    if (!spec.user.empty()) {
        args.push_back("--user");
        args.push_back(spec.user);
    }

    // Security: drop capabilities
    for (const auto& cap : spec.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (spec.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    // Read-only root filesystem with scratch tmpfs
    if (spec.read_only_rootfs) {
        args.push_back("--read-only");
    }
    for (const auto& dir : spec.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(dir + ":rw,nosuid,nodev,size=64m");
    }

    // Memory limit (swap pinned so the limit cannot be exceeded via swap)
    args.push_back("--memory");
    args.push_back(std::to_string(spec.memory_limit_bytes) + "b");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(spec.memory_limit_bytes) + "b");

    // CPU limit
    args.push_back("--cpus");
    args.push_back(std::to_string(spec.cpu_limit));

    // Process limit
    args.push_back("--pids-limit");
    args.push_back(std::to_string(spec.pids_limit));

    // Volume mounts
    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.ToDockerArg());
    }

    // Environment variables
    for (const auto& [key, value] : spec.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Working directory
    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }

    // Keep-alive entrypoint: docker takes only the program via --entrypoint
    if (!spec.entrypoint.empty()) {
        args.push_back("--entrypoint");
        args.push_back(spec.entrypoint.front());
    }

    // Image (must be last before command)
    args.push_back(spec.image);

    if (spec.entrypoint.size() > 1) {
        args.insert(args.end(), spec.entrypoint.begin() + 1, spec.entrypoint.end());
    }
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::vector<std::string> DockerCliClient::BuildExecArgs(const ExecSpec& spec) {
    std::vector<std::string> args = {"exec"};

    for (const auto& [key, value] : spec.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    if (spec.working_dir && !spec.working_dir->empty()) {
        args.push_back("-w");
        args.push_back(*spec.working_dir);
    }

    args.push_back(spec.container_id);
    args.push_back("sh");
    args.push_back("-c");
    args.push_back(kExecWrapper);
    args.push_back(kExecArgv0);
    args.insert(args.end(), spec.argv.begin(), spec.argv.end());

    return args;
}

// ============================================================================
// OUTPUT PARSING
// ============================================================================

ContainerState DockerCliClient::ParseInspectState(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            return ContainerState::UNKNOWN;
        }
        j = j[0];
    }

    if (!j.contains("State") || !j["State"].is_object()) {
        return ContainerState::UNKNOWN;
    }

    return ParseState(j["State"].value("Status", ""));
}

ContainerState DockerCliClient::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "exited") return ContainerState::STOPPED;
    if (state_str == "removing") return ContainerState::REMOVED;
    if (state_str == "dead") return ContainerState::FAILED;
    return ContainerState::UNKNOWN;
}

std::optional<long> DockerCliClient::StripExecPidLine(std::string& stderr_output) {
    auto newline = stderr_output.find('\n');
    std::string first_line = stderr_output.substr(0, newline);

    if (first_line.empty() ||
        first_line.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    long pid = 0;
    try {
        pid = std::stol(first_line);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }

    stderr_output.erase(0, newline == std::string::npos ? stderr_output.size() : newline + 1);
    return pid;
}

bool DockerCliClient::IsNotFoundMessage(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container") ||
           StringUtils::Contains(stderr_output, "No such object") ||
           StringUtils::Contains(stderr_output, "No such image");
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

RuntimeResult DockerCliClient::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                    std::chrono::milliseconds timeout,
                                                    std::size_t max_output_bytes) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Truncate(StringUtils::Join(argv, " "), 512));

    ProcessOptions options;
    options.timeout = timeout;
    options.max_output_bytes = max_output_bytes;

    auto process = RunProcess(argv, options);

    RuntimeResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);
    result.timed_out = process.timed_out;
    result.output_truncated = process.stdout_truncated || process.stderr_truncated;
    result.duration = process.duration;
    result.success = !process.timed_out && process.exit_code == 0;
    result.not_found = !result.success && IsNotFoundMessage(result.stderr_output);

    if (process.exit_code == 127 && result.stderr_output.empty()) {
        spdlog::error("Docker binary could not be executed: {}", docker_binary_);
        result.runtime_error = true;
    }

    return result;
}

// ============================================================================
// FREE FUNCTIONS
// ============================================================================

std::string StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::STOPPED: return "stopped";
        case ContainerState::REMOVED: return "removed";
        case ContainerState::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string NetworkModeToString(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::BRIDGE: return "bridge";
        case NetworkMode::HOST: return "host";
        case NetworkMode::NONE:
        default: return "none";
    }
}

bool IsRootUser(const std::string& user) {
    std::string name = user.substr(0, user.find(':'));
    if (name.empty() || name == "root") {
        return true;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) { return c == '0'; });
}

std::vector<std::string> CheckSecurityIssues(const ContainerSpec& spec) {
    std::vector<std::string> issues;

    if (spec.network_mode == NetworkMode::HOST) {
        issues.push_back("CRITICAL: Host network mode - sandboxed code reaches host network");
    } else if (spec.network_mode != NetworkMode::NONE) {
        issues.push_back("WARNING: Network enabled (" + NetworkModeToString(spec.network_mode) + ")");
    }

    if (IsRootUser(spec.user)) {
        issues.push_back("WARNING: Running as root user");
    }

    bool drops_all = false;
    for (const auto& cap : spec.capabilities_drop) {
        if (cap == "ALL") {
            drops_all = true;
        }
    }
    if (!drops_all) {
        issues.push_back("WARNING: Capabilities not fully dropped");
    }

    if (!spec.no_new_privileges) {
        issues.push_back("WARNING: Privilege escalation not blocked");
    }

    if (!spec.read_only_rootfs) {
        issues.push_back("WARNING: Writable root filesystem");
    }

    for (const auto& mount : spec.mounts) {
        if (!mount.read_only) {
            spdlog::debug("Writable mount: {}", mount.ToDockerArg());
        }
    }

    return issues;
}

std::string GenerateContainerName(const std::string& prefix) {
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + HashUtils::RandomHex(4);
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::uint64_t bytes) {
    config_.memory_limit_bytes = bytes;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const MountSpec& mount) {
    config_.mounts.push_back(mount);
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithReadOnlyRootfs(bool read_only) {
    config_.read_only_rootfs = read_only;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerSpec ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace cloister
