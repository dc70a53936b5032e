/**
 * @file repository_ops.hpp
 * @brief Constrained repository clone, listing and reading
 *
 * Repositories are cloned by a short-lived container that is the only
 * container ever granted network access. The resulting working tree is then
 * mounted read-only into a network-isolated reader container, and all
 * listing and reading goes through it with paths confined to the clone root.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/command_executor.hpp"
#include "cloister/core/container_manager.hpp"
#include "cloister/core/file_bridge.hpp"
#include "cloister/core/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class RepositoryOps
 * @brief Repository operations keyed by reader container id
 *
 * **Clone Workflow**:
 * ```
 * URL check → session dir + writable "repo" dir → clone container (bridge net)
 *   → git clone [--depth 1] [--branch B] → [git checkout --detach C]
 *   → git rev-parse HEAD → chmod tree for host cleanup → remove clone container
 *   → reader container (no net, clone mounted read-only) → handle
 * ```
 *
 * **Thread Safety**: Thread-safe; the handle map is mutex-guarded.
 */
class RepositoryOps {
public:
    RepositoryOps(FileBridge& bridge, ContainerManager& manager, CommandExecutor& executor);

    /**
     * @brief Clone a repository and start its reader container
     *
     * @param url https:// URL without credentials or shell metacharacters
     * @param options Branch, commit and timeout
     * @return Handle describing the clone and its reader container
     *
     * @throws SandboxError(SECURITY_VIOLATION) on an unacceptable URL or ref,
     *         before any command is issued
     * @throws SandboxError(COMMAND_EXECUTION) when a git step exits non-zero
     * @throws SandboxError(COMMAND_TIMEOUT) when the clone exceeds its timeout
     *
     * @note Transient resources are cleaned before any exception propagates.
     */
    RepositoryHandle Clone(const std::string& url, const CloneOptions& options = {});

    /**
     * @brief List files below a path of a cloned repository
     * @param container_id Reader container id
     * @param path Container path equal to or below the clone root
     * @return Sorted paths relative to `path`, `.git` excluded
     *
     * @throws SandboxError(COMMAND_EXECUTION) for an unknown container id
     * @throws SandboxError(SECURITY_VIOLATION) for a path outside the clone
     * @throws SandboxError(FILE_SYSTEM) when the path does not exist
     */
    std::vector<std::string> ListFiles(const std::string& container_id, const std::string& path);

    /**
     * @brief Read a file of a cloned repository
     * @param container_id Reader container id
     * @param path Container path strictly below the clone root
     * @return File content, byte-exact
     *
     * @throws SandboxError(COMMAND_EXECUTION) for an unknown container id
     * @throws SandboxError(SECURITY_VIOLATION) for a path outside the clone
     * @throws SandboxError(FILE_SYSTEM) when the file cannot be read
     */
    std::string ReadFile(const std::string& container_id, const std::string& path);

    std::optional<RepositoryHandle> GetHandle(const std::string& container_id) const;

    /// Drop a handle, returning it if it existed
    std::optional<RepositoryHandle> Release(const std::string& container_id);

    std::vector<RepositoryHandle> Handles() const;

    /// @throws SandboxError(SECURITY_VIOLATION) unless the URL is acceptable
    static void ValidateRepositoryUrl(const std::string& url);

    /// @throws SandboxError(SECURITY_VIOLATION) unless the branch name is acceptable
    static void ValidateBranch(const std::string& branch);

    /// @throws SandboxError(SECURITY_VIOLATION) unless the commit is 7-40 hex digits
    static void ValidateCommit(const std::string& commit);

private:
    FileBridge& bridge_;
    ContainerManager& manager_;
    CommandExecutor& executor_;

    mutable std::mutex mutex_;
    std::map<std::string, RepositoryHandle> handles_;

    RepositoryHandle RequireHandle(const std::string& container_id) const;
    std::string RunStep(const std::string& container_id, const std::vector<std::string>& argv,
                        std::chrono::milliseconds timeout, const std::string& step);
    std::string ResolveConfined(const RepositoryHandle& handle, const std::string& path,
                                bool allow_root);
    void DiscardContainer(const std::string& container_id);
};

} // namespace core
} // namespace cloister
