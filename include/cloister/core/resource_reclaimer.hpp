/**
 * @file resource_reclaimer.hpp
 * @brief Best-effort teardown of containers and session directories
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/container_manager.hpp"
#include "cloister/core/file_bridge.hpp"
#include "cloister/core/repository_ops.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @struct CleanupReport
 * @brief Outcome counters of a cleanup sweep
 */
struct CleanupReport {
    std::size_t containers_removed{0};   ///< Containers stopped, removed and forgotten
    std::size_t containers_failed{0};    ///< Containers the runtime refused to remove
    std::size_t sessions_removed{0};     ///< Session directories deleted
    std::size_t sessions_failed{0};      ///< Session directories that could not be deleted
    std::vector<std::string> errors;     ///< One message per failure

    bool Clean() const { return containers_failed == 0 && sessions_failed == 0; }
};

/**
 * @class ResourceReclaimer
 * @brief Idempotent cleanup over the manager and bridge registries
 *
 * No method throws; every failure is logged and counted.
 */
class ResourceReclaimer {
public:
    ResourceReclaimer(ContainerManager& manager, FileBridge& bridge, RepositoryOps& repositories);

    /**
     * @brief Stop, remove and forget one container
     *
     * A repository handle bound to the container is released together with
     * its clone session. The registry entry is dropped even when the runtime
     * refuses removal. Calling twice is a no-op the second time.
     *
     * @return false if the runtime could not remove the container
     */
    bool CleanupContainer(const std::string& container_id) noexcept;

    /// Remove a session directory; false (logged) on failure
    bool CleanupSession(const std::filesystem::path& session_dir) noexcept;

    /// Sweep all registered containers, then all registered sessions
    CleanupReport CleanupAll() noexcept;

private:
    ContainerManager& manager_;
    FileBridge& bridge_;
    RepositoryOps& repositories_;
};

} // namespace core
} // namespace cloister
