/**
 * @file sandbox_engine.cpp
 * @brief Implementation of the sandbox engine facade
 *
 * **Typical Session**:
 * ```
 * 1. CreateSession           → host scratch dir
 * 2. PrepareFiles            → validated files, read-only mounts
 * 3. CreateAndStartContainer → hardened container (network none, non-root)
 * 4. ExecuteCommand / RunTool → exit code + streams
 * 5. CleanupContainer + CleanupSessionDir (or CleanupAll)
 * ```
 *
 * @date 2025
 */

#include "cloister/core/sandbox_engine.hpp"
#include "cloister/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloister {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

std::shared_ptr<utils::RuntimeClient> SandboxEngine::ResolveRuntime(
    const EngineConfig& config, std::shared_ptr<utils::RuntimeClient> runtime) {
    ValidateConfig(config);
    if (runtime) {
        return runtime;
    }
    return std::make_shared<utils::DockerCliClient>(config.docker_binary);
}

SandboxEngine::SandboxEngine(const EngineConfig& config,
                             std::shared_ptr<utils::RuntimeClient> runtime)
    : config_(config)
    , runtime_(ResolveRuntime(config, std::move(runtime)))
    , bridge_(config_)
    , manager_(config_, runtime_)
    , executor_(manager_)
    , repositories_(bridge_, manager_, executor_)
    , reclaimer_(manager_, bridge_, repositories_)
    , tools_(ToolRegistry::WithDefaults()) {

    spdlog::info("Sandbox Engine initialized");
    spdlog::debug("Base image: {}", config_.base_image);
    spdlog::debug("Temp root: {}", bridge_.TempRoot().string());
    spdlog::debug("Default limits: {} cpus, {} bytes, {} pids",
                  config_.default_resource_limits.cpus,
                  config_.default_resource_limits.memory_bytes,
                  config_.default_resource_limits.pids);
    spdlog::debug("Command timeout: {} ms", config_.command_timeout.count());
}

SandboxEngine::~SandboxEngine() {
    reclaimer_.CleanupAll();
    spdlog::info("Sandbox Engine destroyed");
}

// ============================================================================
// SESSIONS AND FILES
// ============================================================================

std::filesystem::path SandboxEngine::CreateSession(const std::string& prefix) {
    return bridge_.CreateSessionDir(prefix);
}

std::vector<MountSpec> SandboxEngine::PrepareFiles(const std::filesystem::path& session_dir,
                                                   const std::map<std::string, std::string>& files) {
    return bridge_.PrepareFilesForMount(session_dir, files);
}

MountSpec SandboxEngine::CreateOutputDir(const std::filesystem::path& session_dir,
                                         const std::string& name) {
    return bridge_.CreateOutputDir(session_dir, name);
}

std::vector<StagedFile> SandboxEngine::StagedFiles(const std::filesystem::path& session_dir) const {
    return bridge_.StagedFiles(session_dir);
}

// ============================================================================
// CONTAINERS AND EXECUTION
// ============================================================================

std::string SandboxEngine::CreateAndStartContainer(const ContainerRequest& request) {
    return manager_.CreateAndStart(request);
}

ExecutionResult SandboxEngine::ExecuteCommand(const std::string& container_id,
                                              const std::vector<std::string>& argv,
                                              const ExecutionOptions& options) {
    return executor_.Execute(container_id, argv, options);
}

ContainerState SandboxEngine::ContainerStatus(const std::string& container_id) {
    return manager_.Status(container_id);
}

ExecutionResult SandboxEngine::RunTool(const std::string& name, const std::string& container_id,
                                       const std::string& workdir) {
    return tools_.Run(name, executor_, container_id, workdir);
}

// ============================================================================
// REPOSITORIES
// ============================================================================

RepositoryHandle SandboxEngine::CloneRepository(const std::string& url,
                                                const CloneOptions& options) {
    return repositories_.Clone(url, options);
}

std::vector<std::string> SandboxEngine::ListRepositoryFiles(const std::string& container_id,
                                                            const std::string& path) {
    return repositories_.ListFiles(container_id, path);
}

std::string SandboxEngine::ReadRepositoryFile(const std::string& container_id,
                                              const std::string& path) {
    return repositories_.ReadFile(container_id, path);
}

// ============================================================================
// CLEANUP
// ============================================================================

bool SandboxEngine::CleanupContainer(const std::string& container_id) {
    return reclaimer_.CleanupContainer(container_id);
}

void SandboxEngine::CleanupSessionDir(const std::filesystem::path& session_dir) {
    bridge_.CleanupSessionDir(session_dir);
}

CleanupReport SandboxEngine::CleanupAll() {
    return reclaimer_.CleanupAll();
}

std::vector<std::string> SandboxEngine::FindOrphans() {
    return manager_.FindOrphans();
}

bool SandboxEngine::ReapOrphan(const std::string& container_id) {
    if (manager_.IsRegistered(container_id)) {
        spdlog::warn("Refusing to reap tracked container {}", container_id);
        return false;
    }

    auto orphans = manager_.FindOrphans();
    if (std::find(orphans.begin(), orphans.end(), container_id) == orphans.end()) {
        spdlog::warn("Refusing to reap {}: not a labelled cloister container", container_id);
        return false;
    }

    spdlog::info("Reaping orphaned container {}", container_id);
    manager_.Stop(container_id);
    return manager_.Remove(container_id);
}

// ============================================================================
// ASYNCHRONOUS VARIANTS
// ============================================================================

std::future<ExecutionResult> SandboxEngine::ExecuteCommandAsync(
    const std::string& container_id,
    const std::vector<std::string>& argv,
    const ExecutionOptions& options) {

    return std::async(std::launch::async, [this, container_id, argv, options]() {
        return executor_.Execute(container_id, argv, options);
    });
}

std::future<RepositoryHandle> SandboxEngine::CloneRepositoryAsync(const std::string& url,
                                                                  const CloneOptions& options) {
    return std::async(std::launch::async, [this, url, options]() {
        return repositories_.Clone(url, options);
    });
}

std::future<std::string> SandboxEngine::CreateAndStartContainerAsync(
    const ContainerRequest& request) {

    return std::async(std::launch::async, [this, request]() {
        return manager_.CreateAndStart(request);
    });
}

} // namespace core
} // namespace cloister
