/**
 * @file types.hpp
 * @brief Value types shared by the sandbox engine components
 *
 * Requests, results and records exchanged between the file bridge, the
 * container manager, the command executor and repository operations.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/engine_config.hpp"
#include "cloister/utils/container_utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloister {
namespace core {

using utils::ContainerState;
using utils::MountSpec;
using utils::NetworkMode;

/// Label carried by every container this engine creates
inline constexpr const char* kManagedLabelKey = "cloister.managed";
inline constexpr const char* kManagedLabelValue = "true";

/**
 * @struct NetworkOverride
 * @brief Named exception to network isolation
 *
 * The reason is logged when the container is created.
 */
struct NetworkOverride {
    NetworkMode mode{NetworkMode::BRIDGE};
    std::string reason;
};

/**
 * @struct ContainerRequest
 * @brief Caller-facing container creation request
 *
 * Unset fields fall back to EngineConfig defaults.
 */
struct ContainerRequest {
    std::string image;                                  ///< Empty = config base image
    std::optional<ResourceLimits> limits;               ///< Unset = config defaults
    std::vector<MountSpec> mounts;                      ///< From the file bridge
    std::map<std::string, std::string> environment_vars;
    std::map<std::string, std::string> labels;          ///< Extra labels
    std::string name_prefix{"cloister"};
    std::optional<NetworkOverride> network_override;    ///< Only for repository cloning
};

/**
 * @struct ContainerRecord
 * @brief Registry entry for a container owned by the manager
 */
struct ContainerRecord {
    std::string id;
    std::string name;
    std::string image;
    ResourceLimits limits;
    NetworkMode network_mode{NetworkMode::NONE};
    std::string user;
    std::vector<MountSpec> mounts;
    std::map<std::string, std::string> labels;
    ContainerState state{ContainerState::CREATED};
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point started_at;
};

/**
 * @struct ExecutionOptions
 * @brief Per-command overrides
 */
struct ExecutionOptions {
    std::optional<std::chrono::milliseconds> timeout;   ///< Unset = commandTimeoutMs
    std::map<std::string, std::string> environment_vars;
    std::optional<std::string> working_dir;
};

/**
 * @struct ExecutionRequest
 * @brief Command to run inside a registered container
 */
struct ExecutionRequest {
    std::string container_id;
    std::vector<std::string> argv;
    ExecutionOptions options;
};

/**
 * @struct ExecutionResult
 * @brief Materialized outcome of one exec
 *
 * The exit code is reported verbatim; no success judgement is made.
 */
struct ExecutionResult {
    int exit_code{-1};                      ///< Exit code from the runtime
    std::string stdout_output;              ///< Captured stdout (byte-exact)
    std::string stderr_output;              ///< Captured stderr (byte-exact)
    std::chrono::milliseconds duration{0};  ///< Wall-clock duration
    bool output_truncated{false};           ///< maxOutputBytes reached
};

/**
 * @struct StagedFile
 * @brief Audit record of a file written into a session directory
 */
struct StagedFile {
    std::string relative_path;
    std::filesystem::path host_path;
    std::uint64_t size_bytes{0};
    std::string sha256;
};

/**
 * @struct CloneOptions
 * @brief Repository clone parameters
 *
 * Without a commit the clone is shallow (`--depth 1`).
 */
struct CloneOptions {
    std::optional<std::string> branch;
    std::optional<std::string> commit;
    std::optional<std::chrono::milliseconds> timeout;   ///< Unset = cloneTimeoutMs
};

/**
 * @struct RepositoryHandle
 * @brief A cloned repository mounted read-only into a reader container
 */
struct RepositoryHandle {
    std::filesystem::path session_dir;      ///< Host scratch dir owning the clone
    std::filesystem::path host_path;        ///< Host path of the working tree
    std::string container_path;             ///< Clone root inside the container
    std::string container_id;               ///< Reader container
    std::string reference;                  ///< Requested branch or commit ("" = default)
    std::string commit_sha;                 ///< Resolved HEAD
};

} // namespace core
} // namespace cloister
