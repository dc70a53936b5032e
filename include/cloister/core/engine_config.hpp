/**
 * @file engine_config.hpp
 * @brief Static configuration of the sandbox engine
 *
 * Options are supplied by the embedding process, either built in code or
 * parsed from a JSON document. Unknown keys are ignored; malformed values
 * raise SandboxError(CONFIGURATION).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace cloister {
namespace core {

/**
 * @struct ResourceLimits
 * @brief Per-container resource quotas (never unlimited)
 */
struct ResourceLimits {
    double cpus{0.5};                                  ///< CPU quota in cores
    std::uint64_t memory_bytes{256ull * 1024 * 1024};  ///< Memory limit (256 MiB)
    int pids{128};                                     ///< Process count limit
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 *
 * **JSON Example**:
 * @code
 * {
 *   "baseImage": "python:3.12-slim",
 *   "tempHostDir": "/var/tmp/cloister",
 *   "defaultResourceLimits": { "cpus": 0.5, "memory": "512m", "pids": 128 },
 *   "defaultNetworkMode": "none",
 *   "containerUser": "1000:1000",
 *   "commandTimeoutMs": 30000,
 *   "blockedExtensions": [".exe", ".so"],
 *   "maxFileSizeBytes": 1048576,
 *   "maxFileCount": 200
 * }
 * @endcode
 */
struct EngineConfig {
    // Images
    std::string base_image{"ubuntu:latest"};         ///< Default container image
    std::string git_image{"alpine/git:latest"};      ///< Image used for clones
    bool pull_missing_images{true};                  ///< Pull image when absent

    // Host Filesystem
    std::filesystem::path temp_host_dir{std::filesystem::temp_directory_path() / "cloister"};

    // Container Policy
    ResourceLimits default_resource_limits;
    std::string default_network_mode{"none"};        ///< Only "none" is accepted
    std::string container_user{"1000:1000"};         ///< Non-root uid:gid
    std::string container_workdir{"/workspace"};     ///< Mount root inside containers
    std::chrono::seconds stop_grace_period{5};       ///< docker stop --time

    // Execution
    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds clone_timeout{120000};
    std::size_t max_output_bytes{10 * 1024 * 1024};

    // Mounted Input Limits
    std::set<std::string> allowed_extensions;        ///< Empty = any not blocked
    std::set<std::string> blocked_extensions{
        ".exe", ".dll", ".so", ".dylib", ".bat", ".cmd", ".com", ".scr", ".ps1"};
    std::uint64_t max_file_size_bytes{1024 * 1024};
    std::size_t max_file_count{200};

    // Runtime
    std::string docker_binary{"docker"};
    std::string log_level{"info"};
};

/**
 * @brief Parse a memory limit such as "512m", "1g", "65536k" or "1048576"
 *
 * Suffixes b/k/m/g are case-insensitive and binary (1k = 1024).
 *
 * @param value Memory limit string
 * @return Bytes
 * @throws SandboxError(CONFIGURATION) on malformed or zero values
 */
std::uint64_t ParseMemoryLimit(const std::string& value);

/**
 * @brief Parse configuration from JSON text, starting from defaults
 * @param json_text JSON document
 * @return Validated configuration
 * @throws SandboxError(CONFIGURATION) on malformed JSON or invalid values
 */
EngineConfig ParseConfig(const std::string& json_text);

/**
 * @brief Load configuration from a JSON file
 * @param path Config file path
 * @return Validated configuration
 * @throws SandboxError(CONFIGURATION) if the file cannot be read or parsed
 */
EngineConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Check invariants (positive quotas and timeouts, isolated network)
 * @throws SandboxError(CONFIGURATION) naming the first offending option
 */
void ValidateConfig(const EngineConfig& config);

/**
 * @brief Apply a spdlog level name ("trace" ... "off") to the default logger
 * @param level Level name; unknown names fall back to info with a warning
 */
void ApplyLogLevel(const std::string& level);

} // namespace core
} // namespace cloister
