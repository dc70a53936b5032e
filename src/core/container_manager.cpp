/**
 * @file container_manager.cpp
 * @brief Implementation of the container lifecycle manager
 *
 * **Creation Workflow**:
 * ```
 * 1. Policy      → limits, network, user, labels applied to the request
 * 2. Audit       → CheckSecurityIssues warnings logged
 * 3. Image       → inspect, pull when missing
 * 4. Create      → docker create with hardening flags
 * 5. Register    → record added in CREATED state
 * 6. Start       → RUNNING, or FAILED + force remove
 * ```
 *
 * @date 2025
 */

#include "cloister/core/container_manager.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>

namespace cloister {
namespace core {

// ============================================================================
// CONTAINER REGISTRY
// ============================================================================

void ContainerRegistry::Add(const ContainerRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
}

bool ContainerRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) > 0;
}

bool ContainerRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(id) > 0;
}

std::optional<ContainerRecord> ContainerRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ContainerRegistry::SetState(const std::string& id, ContainerState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it != records_.end()) {
        it->second.state = state;
        if (state == ContainerState::RUNNING) {
            it->second.started_at = std::chrono::system_clock::now();
        }
    }
}

std::vector<std::string> ContainerRegistry::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ContainerRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerManager::ContainerManager(const EngineConfig& config,
                                   std::shared_ptr<utils::RuntimeClient> runtime)
    : config_(config)
    , runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw SandboxError(ErrorKind::CONFIGURATION, "Container manager requires a runtime client");
    }
}

// ============================================================================
// CREATION
// ============================================================================

utils::ContainerSpec ContainerManager::BuildContainerSpec(const ContainerRequest& request) const {
    ResourceLimits limits = request.limits.value_or(config_.default_resource_limits);

    if (limits.cpus <= 0.0) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "CPU quota must be greater than zero",
                           {{"cpus", std::to_string(limits.cpus)}});
    }
    if (limits.memory_bytes == 0) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "Memory limit must be greater than zero",
                           {{"memory_bytes", "0"}});
    }
    if (limits.pids <= 0) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "Process limit must be greater than zero",
                           {{"pids", std::to_string(limits.pids)}});
    }

    NetworkMode network = NetworkMode::NONE;
    if (request.network_override) {
        network = request.network_override->mode;
    }

    utils::ContainerBuilder builder;
    builder.WithName(utils::GenerateContainerName(request.name_prefix))
           .WithImage(request.image.empty() ? config_.base_image : request.image)
           .WithCPULimit(limits.cpus)
           .WithMemoryLimit(limits.memory_bytes)
           .WithPidsLimit(limits.pids)
           .WithNetwork(network)
           .WithUser(config_.container_user)
           .DropAllCapabilities()
           .WithReadOnlyRootfs(true)
           .WithWorkingDir(config_.container_workdir)
           .WithLabel(kManagedLabelKey, kManagedLabelValue);

    for (const auto& [key, value] : request.labels) {
        builder.WithLabel(key, value);
    }
    for (const auto& [key, value] : request.environment_vars) {
        builder.WithEnvironment(key, value);
    }
    for (const auto& mount : request.mounts) {
        builder.WithMount(mount);
    }

    return builder.Build();
}

std::string ContainerManager::CreateAndStart(const ContainerRequest& request) {
    auto spec = BuildContainerSpec(request);

    if (request.network_override) {
        spdlog::warn("Network override for {}: {} ({})", spec.name,
                     utils::NetworkModeToString(request.network_override->mode),
                     request.network_override->reason);
    }
    for (const auto& issue : utils::CheckSecurityIssues(spec)) {
        spdlog::warn("Security audit [{}]: {}", spec.name, issue);
    }

    EnsureImage(spec.image);

    auto created = runtime_->CreateContainer(spec);
    if (!created.success) {
        throw SandboxError(ErrorKind::CONTAINER_CREATION, "Failed to create container",
                           {{"image", spec.image}, {"name", spec.name}},
                           utils::StringUtils::Trim(created.stderr_output));
    }

    std::string container_id = utils::StringUtils::Trim(created.stdout_output);
    if (container_id.empty()) {
        throw SandboxError(ErrorKind::CONTAINER_CREATION, "Runtime returned no container id",
                           {{"image", spec.image}, {"name", spec.name}});
    }

    ContainerRecord record;
    record.id = container_id;
    record.name = spec.name;
    record.image = spec.image;
    record.limits = request.limits.value_or(config_.default_resource_limits);
    record.network_mode = spec.network_mode;
    record.user = spec.user;
    record.mounts = spec.mounts;
    record.labels = spec.labels;
    record.state = ContainerState::CREATED;
    record.created_at = std::chrono::system_clock::now();
    registry_.Add(record);

    auto started = runtime_->StartContainer(container_id);
    if (!started.success) {
        registry_.SetState(container_id, ContainerState::FAILED);

        auto removed = runtime_->RemoveContainer(container_id, true);
        if (removed.success || removed.not_found) {
            registry_.Remove(container_id);
        } else {
            spdlog::error("Failed container {} could not be removed; left for cleanup",
                          container_id);
        }

        throw SandboxError(ErrorKind::CONTAINER_CREATION, "Failed to start container",
                           {{"container_id", container_id}, {"image", spec.image}},
                           utils::StringUtils::Trim(started.stderr_output));
    }

    registry_.SetState(container_id, ContainerState::RUNNING);
    spdlog::info("Container running: {} ({}, network: {}, user: {})",
                 container_id.substr(0, 12), spec.name,
                 utils::NetworkModeToString(spec.network_mode), spec.user);

    return container_id;
}

void ContainerManager::EnsureImage(const std::string& image) {
    if (runtime_->ImageExists(image)) {
        return;
    }

    if (!config_.pull_missing_images) {
        throw SandboxError(ErrorKind::CONTAINER_CREATION, "Image not present and pulling is disabled",
                           {{"image", image}});
    }

    auto pulled = runtime_->PullImage(image);
    if (!pulled.success) {
        throw SandboxError(ErrorKind::CONTAINER_CREATION, "Failed to pull image",
                           {{"image", image}},
                           pulled.timed_out ? "pull timed out"
                                            : utils::StringUtils::Trim(pulled.stderr_output));
    }
}

// ============================================================================
// STATE AND TEARDOWN
// ============================================================================

ContainerState ContainerManager::Status(const std::string& container_id) {
    auto state = runtime_->InspectState(container_id);
    ContainerState current = state.value_or(ContainerState::REMOVED);

    registry_.SetState(container_id, current);
    spdlog::debug("Container {} state: {}", container_id, utils::StateToString(current));
    return current;
}

bool ContainerManager::Stop(const std::string& container_id) {
    auto result = runtime_->StopContainer(container_id, config_.stop_grace_period);

    if (result.success || result.not_found ||
        utils::StringUtils::Contains(result.stderr_output, "is not running")) {
        registry_.SetState(container_id, ContainerState::STOPPED);
        return true;
    }

    spdlog::warn("Failed to stop container {}: {}", container_id,
                 utils::StringUtils::Trim(result.stderr_output));
    return false;
}

bool ContainerManager::Remove(const std::string& container_id) {
    auto result = runtime_->RemoveContainer(container_id, true);

    if (result.success || result.not_found) {
        registry_.SetState(container_id, ContainerState::REMOVED);
        return true;
    }

    spdlog::warn("Failed to remove container {}: {}", container_id,
                 utils::StringUtils::Trim(result.stderr_output));
    return false;
}

void ContainerManager::Forget(const std::string& container_id) {
    if (registry_.Remove(container_id)) {
        spdlog::debug("Container {} removed from registry", container_id);
    }
}

bool ContainerManager::IsRegistered(const std::string& container_id) const {
    return registry_.Contains(container_id);
}

std::optional<ContainerRecord> ContainerManager::GetRecord(const std::string& container_id) const {
    return registry_.Get(container_id);
}

std::vector<std::string> ContainerManager::ActiveContainerIds() const {
    return registry_.Ids();
}

std::size_t ContainerManager::ActiveCount() const {
    return registry_.Size();
}

std::vector<std::string> ContainerManager::FindOrphans() {
    auto labelled = runtime_->ListContainers(std::string(kManagedLabelKey) + "=" + kManagedLabelValue);

    std::vector<std::string> orphans;
    std::copy_if(labelled.begin(), labelled.end(), std::back_inserter(orphans),
                 [this](const std::string& id) { return !registry_.Contains(id); });

    if (!orphans.empty()) {
        spdlog::info("Found {} orphaned container(s)", orphans.size());
    }
    return orphans;
}

} // namespace core
} // namespace cloister
