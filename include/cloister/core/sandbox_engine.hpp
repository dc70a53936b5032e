/**
 * @file sandbox_engine.hpp
 * @brief Sandbox execution engine facade
 *
 * Single entry point for an orchestrator: stage files, start hardened
 * containers, run commands and tools, clone and inspect repositories, and
 * reclaim everything afterwards. Owns one instance of each component and
 * wires them to a shared runtime client.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/command_executor.hpp"
#include "cloister/core/container_manager.hpp"
#include "cloister/core/engine_config.hpp"
#include "cloister/core/file_bridge.hpp"
#include "cloister/core/repository_ops.hpp"
#include "cloister/core/resource_reclaimer.hpp"
#include "cloister/core/tool_runners.hpp"
#include "cloister/core/types.hpp"
#include "cloister/utils/container_utils.hpp"

#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class SandboxEngine
 * @brief Isolated execution of untrusted code in containers
 *
 * **Architecture**:
 * ```
 * SandboxEngine
 *     ├─ FileBridge          (session dirs, staged files, mounts)
 *     ├─ ContainerManager    (hardened lifecycle, registry)
 *     ├─ CommandExecutor     (exec with timeout)
 *     ├─ RepositoryOps       (clone / list / read)
 *     ├─ ResourceReclaimer   (idempotent teardown)
 *     └─ ToolRegistry        (pytest, flake8, eslint, npm-test)
 *           ↓
 *     RuntimeClient (docker CLI)
 * ```
 *
 * **Thread Safety**: Thread-safe for disjoint session/container pairs.
 * Concurrent execs on one container are not serialized.
 *
 * **Usage Example**:
 * @code
 * SandboxEngine engine(LoadConfig("cloister.json"));
 *
 * auto session = engine.CreateSession();
 * auto mounts = engine.PrepareFiles(session, {{"main.py", "print('ok')"}});
 *
 * ContainerRequest request;
 * request.image = "python:3.12-slim";
 * request.mounts = mounts;
 * auto id = engine.CreateAndStartContainer(request);
 *
 * auto result = engine.ExecuteCommand(id, {"python", "/workspace/main.py"});
 * std::cout << result.stdout_output;   // "ok\n"
 *
 * engine.CleanupContainer(id);
 * engine.CleanupSessionDir(session);
 * @endcode
 */
class SandboxEngine {
public:
    /**
     * @brief Construct engine
     * @param config Validated configuration
     * @param runtime Runtime client; null selects the docker CLI client
     * @throws SandboxError(CONFIGURATION) on invalid configuration
     * @throws SandboxError(FILE_SYSTEM) if the temp root cannot be created
     */
    explicit SandboxEngine(const EngineConfig& config = EngineConfig{},
                           std::shared_ptr<utils::RuntimeClient> runtime = nullptr);

    /// Runs CleanupAll; pending async operations must be finished first
    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /***************************************************************************
     * Sessions and Files
     ***************************************************************************/

    std::filesystem::path CreateSession(const std::string& prefix = "sandbox-");

    std::vector<MountSpec> PrepareFiles(const std::filesystem::path& session_dir,
                                        const std::map<std::string, std::string>& files);

    MountSpec CreateOutputDir(const std::filesystem::path& session_dir, const std::string& name);

    /// Audit records of files staged into a session
    std::vector<StagedFile> StagedFiles(const std::filesystem::path& session_dir) const;

    /***************************************************************************
     * Containers and Execution
     ***************************************************************************/

    std::string CreateAndStartContainer(const ContainerRequest& request);

    ExecutionResult ExecuteCommand(const std::string& container_id,
                                   const std::vector<std::string>& argv,
                                   const ExecutionOptions& options = {});

    ContainerState ContainerStatus(const std::string& container_id);

    /**
     * @brief Run a registered tool in a container
     * @param name Tool name ("pytest", "flake8", "eslint", "npm-test")
     * @param container_id Registered container id
     * @param workdir Working directory inside the container
     */
    ExecutionResult RunTool(const std::string& name, const std::string& container_id,
                            const std::string& workdir);

    /***************************************************************************
     * Repositories
     ***************************************************************************/

    RepositoryHandle CloneRepository(const std::string& url, const CloneOptions& options = {});

    std::vector<std::string> ListRepositoryFiles(const std::string& container_id,
                                                 const std::string& path);

    std::string ReadRepositoryFile(const std::string& container_id, const std::string& path);

    /***************************************************************************
     * Cleanup
     ***************************************************************************/

    /// Never throws; idempotent
    bool CleanupContainer(const std::string& container_id);

    /**
     * @throws SandboxError(SECURITY_VIOLATION) unless below the temp root
     * @throws SandboxError(FILE_SYSTEM) if removal fails
     */
    void CleanupSessionDir(const std::filesystem::path& session_dir);

    CleanupReport CleanupAll();

    /// Labelled containers not tracked by this engine (listing only)
    std::vector<std::string> FindOrphans();

    /**
     * @brief Stop and force-remove an orphan reported by FindOrphans
     * @return false if the id is tracked by this engine, is not a labelled
     *         cloister container, or removal failed
     */
    bool ReapOrphan(const std::string& container_id);

    /***************************************************************************
     * Asynchronous Variants
     ***************************************************************************/
    // Futures rethrow the same SandboxError the blocking call would throw

    std::future<ExecutionResult> ExecuteCommandAsync(const std::string& container_id,
                                                     const std::vector<std::string>& argv,
                                                     const ExecutionOptions& options = {});

    std::future<RepositoryHandle> CloneRepositoryAsync(const std::string& url,
                                                       const CloneOptions& options = {});

    std::future<std::string> CreateAndStartContainerAsync(const ContainerRequest& request);

    /***************************************************************************
     * Introspection
     ***************************************************************************/

    const EngineConfig& GetConfig() const { return config_; }
    std::size_t ActiveContainerCount() const { return manager_.ActiveCount(); }
    std::vector<std::string> ActiveContainerIds() const { return manager_.ActiveContainerIds(); }
    std::vector<std::filesystem::path> ActiveSessions() const { return bridge_.ActiveSessions(); }
    std::vector<std::string> ToolNames() const { return tools_.List(); }
    bool IsRegistered(const std::string& container_id) const {
        return manager_.IsRegistered(container_id);
    }

private:
    EngineConfig config_;                              ///< Configuration
    std::shared_ptr<utils::RuntimeClient> runtime_;    ///< Shared runtime client
    FileBridge bridge_;
    ContainerManager manager_;
    CommandExecutor executor_;
    RepositoryOps repositories_;
    ResourceReclaimer reclaimer_;
    ToolRegistry tools_;

    static std::shared_ptr<utils::RuntimeClient> ResolveRuntime(
        const EngineConfig& config, std::shared_ptr<utils::RuntimeClient> runtime);
};

} // namespace core
} // namespace cloister
