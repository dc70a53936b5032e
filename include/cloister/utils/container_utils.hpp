/**
 * @file container_utils.hpp
 * @brief Container runtime abstraction and Docker CLI implementation
 *
 * Defines the narrow runtime contract the sandbox engine depends on (image
 * presence, create/start/stop/remove, state inspection, exec with deadline,
 * label listing) and a Docker implementation that drives the `docker` binary
 * by argv. Hardening flags are rendered from a ContainerSpec so that every
 * container created through this layer carries the same security posture.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloister {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running and accepts execs
    PAUSED,    ///< Container frozen (execs rejected by runtime)
    STOPPED,   ///< Container exited or was stopped
    REMOVED,   ///< Container removed from runtime
    FAILED,    ///< Startup failed after creation
    UNKNOWN    ///< Runtime did not report a usable state
};

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,     ///< No network access (default)
    BRIDGE,   ///< Default bridge network (used only for repository cloning)
    HOST      ///< Host network (never used by the engine, audited if requested)
};

/**
 * @struct MountSpec
 * @brief Host path bound into a container
 */
struct MountSpec {
    std::filesystem::path host_path;        ///< Absolute host path
    std::filesystem::path container_path;   ///< Absolute container path
    bool read_only{true};                   ///< Read-only unless designated output

    /// Render as a `-v` argument: `host:container[:ro]`
    std::string ToDockerArg() const;
};

/**
 * @struct ContainerSpec
 * @brief Complete container creation request after policy was applied
 */
struct ContainerSpec {
    // Basic Settings
    std::string name;                                  ///< Container name
    std::string image;                                 ///< Base image
    std::vector<std::string> entrypoint{"tail"};       ///< Keep-alive entrypoint
    std::vector<std::string> command{"-f", "/dev/null"}; ///< Entrypoint arguments

    // Resource Limits
    double cpu_limit{0.5};                     ///< CPU quota in cores
    std::uint64_t memory_limit_bytes{0};       ///< Memory limit (swap pinned to it)
    int pids_limit{128};                       ///< Process limit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};

    // Security Settings
    std::string user;                                   ///< Run as user (uid:gid)
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    bool no_new_privileges{true};                       ///< Block setuid escalation
    bool read_only_rootfs{true};                        ///< Read-only root filesystem
    std::vector<std::string> tmpfs{"/tmp"};             ///< Writable tmpfs mounts

    // Filesystem and Environment
    std::vector<MountSpec> mounts;
    std::map<std::string, std::string> environment_vars;
    std::string working_dir{"/workspace"};
    std::map<std::string, std::string> labels;
};

/**
 * @struct ExecSpec
 * @brief A single command invocation inside a running container
 */
struct ExecSpec {
    std::string container_id;
    std::vector<std::string> argv;
    std::map<std::string, std::string> environment_vars;
    std::optional<std::string> working_dir;
    std::chrono::milliseconds timeout{30000};
    std::size_t max_output_bytes{10 * 1024 * 1024};
};

/**
 * @struct RuntimeResult
 * @brief Outcome of one runtime call
 *
 * For execs, `exit_code` is the exec'd process status verbatim and
 * `runtime_error` distinguishes failures of the runtime itself (container
 * gone, exec could not start) from a process that ran and exited non-zero.
 */
struct RuntimeResult {
    bool success{false};                    ///< Runtime call succeeded (exit 0)
    int exit_code{-1};                      ///< Exit code
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    bool timed_out{false};                  ///< Deadline expired
    bool output_truncated{false};           ///< Capture cap reached
    bool not_found{false};                  ///< Target container/image missing
    bool runtime_error{false};              ///< Failure attributable to runtime
    std::chrono::milliseconds duration{0};  ///< Wall-clock duration
};

/**
 * @class RuntimeClient
 * @brief Container runtime contract consumed by the engine
 *
 * Implementations must be safe to call from several threads at once; the
 * engine runs independent sessions concurrently.
 */
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    virtual bool ImageExists(const std::string& image) = 0;
    virtual RuntimeResult PullImage(const std::string& image) = 0;

    /// On success `stdout_output` holds the new container id
    virtual RuntimeResult CreateContainer(const ContainerSpec& spec) = 0;
    virtual RuntimeResult StartContainer(const std::string& container_id) = 0;
    virtual RuntimeResult StopContainer(const std::string& container_id,
                                        std::chrono::seconds grace) = 0;
    virtual RuntimeResult RemoveContainer(const std::string& container_id, bool force) = 0;

    /// std::nullopt when the runtime has no such container
    virtual std::optional<ContainerState> InspectState(const std::string& container_id) = 0;

    /// Run argv in the container; on timeout the in-container process is killed
    virtual RuntimeResult Exec(const ExecSpec& spec) = 0;

    /// Ids of all containers (any state) carrying `label` (key=value)
    virtual std::vector<std::string> ListContainers(const std::string& label) = 0;
};

/**
 * @class DockerCliClient
 * @brief RuntimeClient backed by the `docker` command-line client
 *
 * Every call spawns the docker binary by argv, so no shell ever parses
 * caller-supplied strings.
 *
 * **Exec protocol**: commands run as
 * `sh -c 'echo $$ >&2; exec "$@"' cloister-exec argv...` so the first stderr
 * line carries the in-container PID. The line is stripped before results are
 * returned; on timeout it is used to SIGKILL the process inside the
 * container, leaving the container itself running. Its absence on a
 * non-zero exit means the exec never started (runtime error).
 *
 * **Usage Example**:
 * @code
 * DockerCliClient docker;
 * auto spec = ContainerBuilder().WithImage("python:3.12-slim")
 *                               .WithUser("1000:1000")
 *                               .WithMemoryLimit(256ull << 20)
 *                               .Build();
 * auto created = docker.CreateContainer(spec);
 * docker.StartContainer(StringUtils::Trim(created.stdout_output));
 * @endcode
 */
class DockerCliClient : public RuntimeClient {
public:
    /**
     * @brief Construct client for a docker binary
     * @param docker_binary Binary name or path (looked up on PATH)
     * @param command_timeout Deadline for non-exec runtime calls
     */
    explicit DockerCliClient(std::string docker_binary = "docker",
                             std::chrono::seconds command_timeout = std::chrono::seconds(120));

    /**
     * @brief Check if the docker binary and daemon respond
     * @return true if `docker version` succeeds
     */
    bool IsAvailable() const;

    bool ImageExists(const std::string& image) override;
    RuntimeResult PullImage(const std::string& image) override;
    RuntimeResult CreateContainer(const ContainerSpec& spec) override;
    RuntimeResult StartContainer(const std::string& container_id) override;
    RuntimeResult StopContainer(const std::string& container_id,
                                std::chrono::seconds grace) override;
    RuntimeResult RemoveContainer(const std::string& container_id, bool force) override;
    std::optional<ContainerState> InspectState(const std::string& container_id) override;
    RuntimeResult Exec(const ExecSpec& spec) override;
    std::vector<std::string> ListContainers(const std::string& label) override;

    /***************************************************************************
     * Argument construction and output parsing (exposed for tests)
     ***************************************************************************/

    /// Arguments for `docker create` (without the binary)
    static std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec);

    /// Arguments for `docker exec` wrapping argv in the PID-reporting shell
    static std::vector<std::string> BuildExecArgs(const ExecSpec& spec);

    /// Parse `docker inspect` JSON (array or object) into a state
    static ContainerState ParseInspectState(const std::string& json);

    /// Map a Docker `.State.Status` string to ContainerState
    static ContainerState ParseState(const std::string& state_str);

    /// Split the PID line off exec stderr; returns the PID if present
    static std::optional<long> StripExecPidLine(std::string& stderr_output);

    /// True if runtime stderr reports a missing container or image
    static bool IsNotFoundMessage(const std::string& stderr_output);

private:
    std::string docker_binary_;
    std::chrono::seconds command_timeout_;

    RuntimeResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       std::chrono::milliseconds timeout,
                                       std::size_t max_output_bytes = 10 * 1024 * 1024) const;
    void KillExecProcess(const std::string& container_id, long pid) const;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container specifications
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithMemoryLimit(std::uint64_t bytes);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithMount(const MountSpec& mount);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& WithWorkingDir(const std::string& dir);
    ContainerBuilder& WithReadOnlyRootfs(bool read_only = true);
    ContainerBuilder& DropAllCapabilities();
    ContainerBuilder& WithUser(const std::string& user);

    ContainerSpec Build() const;

private:
    ContainerSpec config_;  ///< Specification being built
};

/// Human-readable state name ("running", "stopped", ...)
std::string StateToString(ContainerState state);

/// Docker network name for a mode ("none", "bridge", "host")
std::string NetworkModeToString(NetworkMode mode);

/**
 * @brief Whether a `user[:group]` string runs as uid 0
 *
 * The user part is compared case-sensitively against "root" and parsed as
 * a number, so "0000" and "root:1000" count as root. An empty user maps to
 * the image default, which is root.
 */
bool IsRootUser(const std::string& user);

/**
 * @brief Audit a spec for weakened isolation
 * @param spec Container specification
 * @return One message per issue (empty when fully hardened)
 */
std::vector<std::string> CheckSecurityIssues(const ContainerSpec& spec);

/**
 * @brief Generate a unique, unpredictable container name
 * @param prefix Name prefix
 * @return `prefix_<unix-seconds>_<random hex>`
 */
std::string GenerateContainerName(const std::string& prefix = "cloister");

} // namespace utils
} // namespace cloister
