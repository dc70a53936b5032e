/**
 * @file file_bridge.hpp
 * @brief Host scratch directories and host-to-container file staging
 *
 * Every session lives in its own uniquely named directory under the
 * configured temp root. Files handed in by the caller are validated as a
 * batch (path confinement, extension policy, size and count quotas) before
 * anything is written, then exposed to containers as read-only mounts.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/engine_config.hpp"
#include "cloister/core/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class FileBridge
 * @brief Session directory allocator and mount spec producer
 *
 * **Path Rules**:
 * - Session dirs must resolve strictly below the temp root
 * - Staged files must resolve strictly below their session dir, with
 *   symlinks followed before the comparison
 * - Anything outside raises SandboxError(SECURITY_VIOLATION) before I/O
 *
 * **Thread Safety**: Thread-safe. The session registry is mutex-guarded;
 * distinct sessions can be staged concurrently.
 *
 * **Usage Example**:
 * @code
 * FileBridge bridge(config);
 * auto session = bridge.CreateSessionDir("job-");
 * auto mounts = bridge.PrepareFilesForMount(session, {{"main.py", "print('ok')"}});
 * // ... create container with mounts ...
 * bridge.CleanupSessionDir(session);
 * @endcode
 */
class FileBridge {
public:
    /**
     * @brief Construct bridge and ensure the temp root exists
     * @param config Engine configuration (temp root, extension policy, quotas)
     * @throws SandboxError(FILE_SYSTEM) if the temp root cannot be created
     */
    explicit FileBridge(const EngineConfig& config);

    FileBridge(const FileBridge&) = delete;
    FileBridge& operator=(const FileBridge&) = delete;

    /**
     * @brief Create a fresh session directory (mode 0700)
     *
     * Name is `prefix + <epoch ms> + "-" + <16 random hex chars>`.
     *
     * @param prefix Name prefix; empty means "sandbox-"
     * @return Absolute host path of the new directory
     *
     * @throws SandboxError(SECURITY_VIOLATION) if prefix contains '/' or ".."
     * @throws SandboxError(FILE_SYSTEM) if the directory cannot be created
     */
    std::filesystem::path CreateSessionDir(const std::string& prefix = "sandbox-");

    /**
     * @brief Validate and write files, returning one read-only mount per file
     *
     * All entries are checked first; a single bad entry aborts the batch
     * with nothing written.
     *
     * @param session_dir Session directory (must be below the temp root)
     * @param files Relative path to file content
     * @return Mount specs targeting `<workdir>/<relative path>`
     *
     * @throws SandboxError(SECURITY_VIOLATION) on escaping paths or blocked extensions
     * @throws SandboxError(RESOURCE_LIMIT) when size or count quotas are exceeded
     * @throws SandboxError(FILE_SYSTEM) on write failures
     */
    std::vector<MountSpec> PrepareFilesForMount(const std::filesystem::path& session_dir,
                                                const std::map<std::string, std::string>& files);

    /**
     * @brief Create a writable output directory inside a session
     * @param session_dir Session directory
     * @param name Single path component
     * @return Writable mount at `<workdir>/<name>`
     */
    MountSpec CreateOutputDir(const std::filesystem::path& session_dir, const std::string& name);

    /**
     * @brief Recursively remove a session directory
     *
     * Already-absent paths are treated as success.
     *
     * @throws SandboxError(SECURITY_VIOLATION) unless strictly below the temp root
     * @throws SandboxError(FILE_SYSTEM) if removal fails
     */
    void CleanupSessionDir(const std::filesystem::path& host_path);

    /// Sessions created by this bridge and not yet cleaned
    std::vector<std::filesystem::path> ActiveSessions() const;

    /// Audit records of files staged into a session
    std::vector<StagedFile> StagedFiles(const std::filesystem::path& session_dir) const;

    /// Canonical temp root
    const std::filesystem::path& TempRoot() const { return temp_root_; }

    /**
     * @brief Check host path containment after symlink resolution
     * @param root Containing directory
     * @param candidate Path to check
     * @param allow_equal Whether candidate == root counts as within
     */
    static bool IsHostPathWithin(const std::filesystem::path& root,
                                 const std::filesystem::path& candidate,
                                 bool allow_equal = false);

    /**
     * @brief Lexical containment check for absolute POSIX container paths
     * @param root Container directory, e.g. "/workspace/repo"
     * @param candidate Container path to check
     * @param allow_equal Whether candidate == root counts as within
     */
    static bool IsContainerPathWithin(const std::string& root,
                                      const std::string& candidate,
                                      bool allow_equal = true);

private:
    EngineConfig config_;
    std::filesystem::path temp_root_;

    mutable std::mutex mutex_;
    std::map<std::filesystem::path, std::vector<StagedFile>> sessions_;

    void RequireSessionDir(const std::filesystem::path& session_dir) const;
    std::filesystem::path ValidateEntry(const std::filesystem::path& session_dir,
                                        const std::string& relative_path,
                                        const std::string& content) const;
    void CheckExtension(const std::string& relative_path) const;
    std::string ContainerPathFor(const std::string& relative_path) const;
};

} // namespace core
} // namespace cloister
