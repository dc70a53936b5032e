/**
 * @file resource_reclaimer.cpp
 * @brief Implementation of cleanup and resource reclamation
 *
 * @date 2025
 */

#include "cloister/core/resource_reclaimer.hpp"

#include <spdlog/spdlog.h>

namespace cloister {
namespace core {

ResourceReclaimer::ResourceReclaimer(ContainerManager& manager, FileBridge& bridge,
                                     RepositoryOps& repositories)
    : manager_(manager)
    , bridge_(bridge)
    , repositories_(repositories) {
}

bool ResourceReclaimer::CleanupContainer(const std::string& container_id) noexcept {
    try {
        auto handle = repositories_.Release(container_id);

        if (!manager_.IsRegistered(container_id)) {
            spdlog::debug("Container {} not registered; nothing to clean", container_id);
            if (handle) {
                CleanupSession(handle->session_dir);
            }
            return true;
        }

        // Stop failures are tolerated; forced removal follows
        if (!manager_.Stop(container_id)) {
            spdlog::debug("Proceeding to forced removal of {}", container_id);
        }

        bool removed = manager_.Remove(container_id);
        if (removed) {
            spdlog::info("Cleaned up container {}", container_id.substr(0, 12));
        } else {
            spdlog::error("Container {} could not be removed; dropped from registry", container_id);
        }

        // The record goes either way; FindOrphans reports a leftover container
        manager_.Forget(container_id);

        if (handle) {
            CleanupSession(handle->session_dir);
        }
        return removed;
    }
    catch (const std::exception& e) {
        spdlog::error("Cleanup of container {} failed: {}", container_id, e.what());
        return false;
    }
}

bool ResourceReclaimer::CleanupSession(const std::filesystem::path& session_dir) noexcept {
    try {
        bridge_.CleanupSessionDir(session_dir);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Cleanup of session {} failed: {}", session_dir.string(), e.what());
        return false;
    }
}

CleanupReport ResourceReclaimer::CleanupAll() noexcept {
    CleanupReport report;

    try {
        // Snapshots: no registry lock is held across runtime calls
        auto containers = manager_.ActiveContainerIds();
        spdlog::info("Cleanup sweep: {} container(s), {} session(s)",
                     containers.size(), bridge_.ActiveSessions().size());

        for (const auto& id : containers) {
            if (CleanupContainer(id)) {
                ++report.containers_removed;
            } else {
                ++report.containers_failed;
                report.errors.push_back("container " + id);
            }
        }

        for (const auto& session : bridge_.ActiveSessions()) {
            if (CleanupSession(session)) {
                ++report.sessions_removed;
            } else {
                ++report.sessions_failed;
                report.errors.push_back("session " + session.string());
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Cleanup sweep aborted: {}", e.what());
        report.errors.push_back(e.what());
    }

    if (report.Clean()) {
        spdlog::info("Cleanup sweep complete: {} container(s), {} session(s) removed",
                     report.containers_removed, report.sessions_removed);
    } else {
        spdlog::warn("Cleanup sweep finished with {} failure(s)", report.errors.size());
    }
    return report;
}

} // namespace core
} // namespace cloister
