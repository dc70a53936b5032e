/**
 * @file container_manager.hpp
 * @brief Container lifecycle management with enforced hardening
 *
 * Creates, starts, inspects, stops and removes sandbox containers through a
 * RuntimeClient. Every container is created with the same security posture
 * (isolated network, non-root user, all capabilities dropped, read-only
 * rootfs, bounded CPU/memory/pids) and tracked in a per-instance registry
 * that is the single source of truth for cleanup.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/engine_config.hpp"
#include "cloister/core/types.hpp"
#include "cloister/utils/container_utils.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class ContainerRegistry
 * @brief Mutex-guarded map of container id to record
 *
 * Accessors return copies so callers never hold the lock across a runtime call.
 */
class ContainerRegistry {
public:
    void Add(const ContainerRecord& record);
    bool Remove(const std::string& id);
    bool Contains(const std::string& id) const;
    std::optional<ContainerRecord> Get(const std::string& id) const;
    void SetState(const std::string& id, ContainerState state);
    std::vector<std::string> Ids() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ContainerRecord> records_;
};

/**
 * @class ContainerManager
 * @brief Owner of all sandbox containers created by one engine instance
 *
 * **Lifecycle**:
 * ```
 * CREATED → RUNNING → STOPPED → REMOVED
 *    └──→ FAILED (start error; container force-removed)
 * ```
 *
 * **Thread Safety**: Thread-safe. Only the registry is shared; runtime calls
 * are made without holding its lock.
 */
class ContainerManager {
public:
    /**
     * @brief Construct manager
     * @param config Engine configuration (defaults and hardening policy)
     * @param runtime Container runtime client
     */
    ContainerManager(const EngineConfig& config, std::shared_ptr<utils::RuntimeClient> runtime);

    ContainerManager(const ContainerManager&) = delete;
    ContainerManager& operator=(const ContainerManager&) = delete;

    /**
     * @brief Create and start a hardened container
     *
     * Pulls the image when missing, creates the container with the keep-alive
     * entrypoint and registers it. If start fails the record becomes FAILED
     * and the container is force-removed.
     *
     * @param request Creation request; unset fields use config defaults
     * @return Runtime container id
     *
     * @throws SandboxError(RESOURCE_LIMIT) on non-positive limits
     * @throws SandboxError(CONTAINER_CREATION) on any runtime failure
     */
    std::string CreateAndStart(const ContainerRequest& request);

    /**
     * @brief Apply policy to a request, producing the runtime spec
     * @throws SandboxError(RESOURCE_LIMIT) on non-positive limits
     */
    utils::ContainerSpec BuildContainerSpec(const ContainerRequest& request) const;

    /**
     * @brief Query runtime state and refresh the registry record
     * @return REMOVED when the runtime no longer knows the container
     */
    ContainerState Status(const std::string& container_id);

    /// Stop container; "not running" and "not found" count as success
    bool Stop(const std::string& container_id);

    /// Force-remove container; "not found" counts as success
    bool Remove(const std::string& container_id);

    /// Drop a container from the registry without touching the runtime
    void Forget(const std::string& container_id);

    bool IsRegistered(const std::string& container_id) const;
    std::optional<ContainerRecord> GetRecord(const std::string& container_id) const;
    std::vector<std::string> ActiveContainerIds() const;
    std::size_t ActiveCount() const;

    /**
     * @brief List labelled containers not tracked by this instance
     *
     * Only lists; reaping is the caller's decision.
     */
    std::vector<std::string> FindOrphans();

    utils::RuntimeClient& Runtime() { return *runtime_; }
    const EngineConfig& Config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<utils::RuntimeClient> runtime_;
    ContainerRegistry registry_;

    void EnsureImage(const std::string& image);
};

} // namespace core
} // namespace cloister
