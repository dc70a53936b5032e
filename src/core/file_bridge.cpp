/**
 * @file file_bridge.cpp
 * @brief Implementation of session directories and file staging
 *
 * **Staging Workflow**:
 * ```
 * 1. Session check  → session dir exists and is strictly below the temp root
 * 2. Count quota    → number of entries ≤ maxFileCount
 * 3. Per entry      → confinement, extension policy, size quota
 * 4. Write          → parents created, content written (mode 0644)
 * 5. Audit          → SHA-256 digest and size logged per file
 * 6. Mounts         → read-only bind per file at <workdir>/<relative path>
 * ```
 *
 * Steps 1-3 complete for the whole batch before step 4 starts.
 *
 * @date 2025
 */

#include "cloister/core/file_bridge.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/hash_utils.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cloister {
namespace core {

namespace {

// Canonicalize as far as the path exists, without a trailing separator
fs::path NormalizeHostPath(const fs::path& path) {
    std::error_code ec;
    fs::path normalized = fs::weakly_canonical(path, ec);
    if (ec) {
        normalized = fs::absolute(path).lexically_normal();
    }
    if (!normalized.has_filename() && normalized.has_parent_path() &&
        normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool IsSinglePathComponent(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

FileBridge::FileBridge(const EngineConfig& config) : config_(config) {
    std::error_code ec;
    fs::create_directories(config_.temp_host_dir, ec);
    if (ec) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot create temp root",
                           {{"path", config_.temp_host_dir.string()}}, ec.message());
    }

    temp_root_ = NormalizeHostPath(config_.temp_host_dir);
    spdlog::debug("File bridge temp root: {}", temp_root_.string());
}

// ============================================================================
// PATH CONTAINMENT
// ============================================================================

bool FileBridge::IsHostPathWithin(const fs::path& root, const fs::path& candidate,
                                  bool allow_equal) {
    fs::path root_norm = NormalizeHostPath(root);
    fs::path candidate_norm = NormalizeHostPath(candidate);

    fs::path relative = candidate_norm.lexically_relative(root_norm);
    if (relative.empty()) {
        return false;
    }
    if (relative == ".") {
        return allow_equal;
    }
    return *relative.begin() != "..";
}

bool FileBridge::IsContainerPathWithin(const std::string& root, const std::string& candidate,
                                       bool allow_equal) {
    if (root.empty() || root.front() != '/' || candidate.empty() || candidate.front() != '/') {
        return false;
    }
    if (candidate.find('\0') != std::string::npos) {
        return false;
    }

    // Container paths are POSIX regardless of the host; normalize lexically
    fs::path root_norm = fs::path(root).lexically_normal();
    fs::path candidate_norm = fs::path(candidate).lexically_normal();

    if (!root_norm.has_filename() && root_norm != root_norm.root_path()) {
        root_norm = root_norm.parent_path();
    }
    if (!candidate_norm.has_filename() && candidate_norm != candidate_norm.root_path()) {
        candidate_norm = candidate_norm.parent_path();
    }

    fs::path relative = candidate_norm.lexically_relative(root_norm);
    if (relative.empty()) {
        return false;
    }
    if (relative == ".") {
        return allow_equal;
    }
    return *relative.begin() != "..";
}

// ============================================================================
// SESSION DIRECTORIES
// ============================================================================

fs::path FileBridge::CreateSessionDir(const std::string& prefix) {
    std::string effective = prefix.empty() ? "sandbox-" : prefix;

    if (effective.find('/') != std::string::npos || effective.find("..") != std::string::npos ||
        effective.find('\0') != std::string::npos) {
        spdlog::warn("Rejected session prefix: {}", effective);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Session prefix must be a plain name",
                           {{"prefix", effective}});
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path session = temp_root_ /
        (effective + std::to_string(millis) + "-" + utils::HashUtils::RandomHex(8));

    std::error_code ec;
    if (!fs::create_directory(session, ec) || ec) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot create session directory",
                           {{"path", session.string()}},
                           ec ? ec.message() : "directory already exists");
    }

    fs::permissions(session, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot restrict permissions of {}: {}", session.string(), ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session];
    }

    spdlog::info("Created session directory: {}", session.string());
    return session;
}

void FileBridge::CleanupSessionDir(const fs::path& host_path) {
    if (!IsHostPathWithin(temp_root_, host_path)) {
        spdlog::warn("Refusing to remove path outside temp root: {}", host_path.string());
        throw SandboxError(ErrorKind::SECURITY_VIOLATION,
                           "Cleanup target is not below the temp root",
                           {{"path", host_path.string()}, {"temp_root", temp_root_.string()}});
    }

    std::error_code ec;
    auto removed = fs::remove_all(host_path, ec);
    if (ec) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Failed to remove session directory",
                           {{"path", host_path.string()}}, ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(host_path);
    }

    if (removed > 0) {
        spdlog::info("Removed session directory: {} ({} entries)", host_path.string(), removed);
    } else {
        spdlog::debug("Session directory already absent: {}", host_path.string());
    }
}

std::vector<fs::path> FileBridge::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<fs::path> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [path, staged] : sessions_) {
        sessions.push_back(path);
    }
    return sessions;
}

std::vector<StagedFile> FileBridge::StagedFiles(const fs::path& session_dir) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_dir);
    if (it == sessions_.end()) {
        return {};
    }
    return it->second;
}

// ============================================================================
// FILE STAGING
// ============================================================================

std::vector<MountSpec> FileBridge::PrepareFilesForMount(
    const fs::path& session_dir,
    const std::map<std::string, std::string>& files) {

    RequireSessionDir(session_dir);

    if (files.size() > config_.max_file_count) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "Too many files for one session",
                           {{"count", std::to_string(files.size())},
                            {"limit", std::to_string(config_.max_file_count)}});
    }

    // Validate the whole batch before touching the filesystem
    std::vector<std::pair<fs::path, const std::string*>> targets;
    targets.reserve(files.size());
    for (const auto& [relative_path, content] : files) {
        targets.emplace_back(ValidateEntry(session_dir, relative_path, content), &content);
    }

    std::vector<MountSpec> mounts;
    std::vector<StagedFile> staged;
    mounts.reserve(files.size());

    auto relative_it = files.begin();
    for (const auto& [host_path, content] : targets) {
        const std::string& relative_path = relative_it->first;
        ++relative_it;

        std::error_code ec;
        fs::create_directories(host_path.parent_path(), ec);
        if (ec) {
            throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot create parent directory",
                               {{"path", host_path.parent_path().string()}}, ec.message());
        }

        std::ofstream out(host_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot open file for writing",
                               {{"path", host_path.string()}});
        }
        out.write(content->data(), static_cast<std::streamsize>(content->size()));
        out.close();
        if (out.fail()) {
            throw SandboxError(ErrorKind::FILE_SYSTEM, "Failed to write file",
                               {{"path", host_path.string()}});
        }

        // Readable by the unprivileged container user, never executable
        fs::permissions(host_path,
                        fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace, ec);

        StagedFile record;
        record.relative_path = relative_path;
        record.host_path = host_path;
        record.size_bytes = content->size();
        record.sha256 = utils::HashUtils::ComputeSHA256(*content);

        spdlog::info("Staged file: {} ({} bytes, sha256={})",
                     relative_path, record.size_bytes, record.sha256);

        MountSpec mount;
        mount.host_path = host_path;
        mount.container_path = ContainerPathFor(relative_path);
        mount.read_only = true;
        mounts.push_back(mount);

        staged.push_back(std::move(record));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& records = sessions_[session_dir];
        records.insert(records.end(), staged.begin(), staged.end());
    }

    return mounts;
}

MountSpec FileBridge::CreateOutputDir(const fs::path& session_dir, const std::string& name) {
    RequireSessionDir(session_dir);

    if (!IsSinglePathComponent(name)) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION,
                           "Output directory name must be a single path component",
                           {{"name", name}});
    }

    fs::path output = session_dir / name;

    std::error_code ec;
    fs::create_directories(output, ec);
    if (ec) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot create output directory",
                           {{"path", output.string()}}, ec.message());
    }

    if (!IsHostPathWithin(session_dir, output)) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION,
                           "Output directory resolves outside its session",
                           {{"path", output.string()}});
    }

    // The container user differs from the host user
    fs::permissions(output, fs::perms::all, fs::perm_options::replace, ec);
    if (ec) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot set output directory permissions",
                           {{"path", output.string()}}, ec.message());
    }

    MountSpec mount;
    mount.host_path = output;
    mount.container_path = ContainerPathFor(name);
    mount.read_only = false;

    spdlog::info("Created writable output directory: {} -> {}",
                 output.string(), mount.container_path.string());
    return mount;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

void FileBridge::RequireSessionDir(const fs::path& session_dir) const {
    if (!IsHostPathWithin(temp_root_, session_dir)) {
        spdlog::warn("Session directory outside temp root: {}", session_dir.string());
        throw SandboxError(ErrorKind::SECURITY_VIOLATION,
                           "Session directory is not below the temp root",
                           {{"path", session_dir.string()}, {"temp_root", temp_root_.string()}});
    }

    std::error_code ec;
    if (!fs::is_directory(session_dir, ec)) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Session directory does not exist",
                           {{"path", session_dir.string()}});
    }
}

fs::path FileBridge::ValidateEntry(const fs::path& session_dir,
                                   const std::string& relative_path,
                                   const std::string& content) const {
    if (relative_path.empty() || relative_path.find('\0') != std::string::npos) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Invalid relative path",
                           {{"path", relative_path}});
    }

    fs::path relative(relative_path);
    if (relative.is_absolute() || relative.has_root_path()) {
        spdlog::warn("Rejected absolute path: {}", relative_path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Absolute paths are not allowed",
                           {{"path", relative_path}, {"session", session_dir.string()}});
    }

    fs::path target = (session_dir / relative).lexically_normal();
    if (!target.has_filename()) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Relative path does not name a file",
                           {{"path", relative_path}});
    }
    if (!IsHostPathWithin(session_dir, target)) {
        spdlog::warn("Rejected path escaping session: {}", relative_path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Path escapes the session directory",
                           {{"path", relative_path}, {"session", session_dir.string()}});
    }

    CheckExtension(relative_path);

    if (content.size() > config_.max_file_size_bytes) {
        throw SandboxError(ErrorKind::RESOURCE_LIMIT, "File exceeds size limit",
                           {{"path", relative_path},
                            {"size", std::to_string(content.size())},
                            {"limit", std::to_string(config_.max_file_size_bytes)}});
    }

    return target;
}

void FileBridge::CheckExtension(const std::string& relative_path) const {
    std::string extension = utils::StringUtils::ToLower(fs::path(relative_path).extension().string());
    if (extension.empty()) {
        return;
    }

    if (config_.blocked_extensions.count(extension) > 0) {
        spdlog::warn("Rejected blocked extension {}: {}", extension, relative_path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "File extension is blocked",
                           {{"path", relative_path}, {"extension", extension}});
    }

    if (!config_.allowed_extensions.empty() &&
        config_.allowed_extensions.count(extension) == 0) {
        spdlog::warn("Rejected extension not on allow-list {}: {}", extension, relative_path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "File extension is not allowed",
                           {{"path", relative_path}, {"extension", extension}});
    }
}

std::string FileBridge::ContainerPathFor(const std::string& relative_path) const {
    std::string root = config_.container_workdir;
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    return (fs::path(root) / fs::path(relative_path)).lexically_normal().generic_string();
}

} // namespace core
} // namespace cloister
