/**
 * @file repository_ops.cpp
 * @brief Implementation of repository clone, listing and reading
 *
 * @date 2025
 */

#include "cloister/core/repository_ops.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace cloister {
namespace core {

namespace {

constexpr const char* kCloneDirName = "repo";
constexpr const char* kShellMetacharacters = ";&|$`<>(){}[]\\'\"!*?~^# \t\r\n";

std::string NormalizeContainerPath(const std::string& path) {
    std::string normalized = std::filesystem::path(path).lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

} // anonymous namespace

RepositoryOps::RepositoryOps(FileBridge& bridge, ContainerManager& manager,
                             CommandExecutor& executor)
    : bridge_(bridge)
    , manager_(manager)
    , executor_(executor) {
}

// ============================================================================
// INPUT VALIDATION
// ============================================================================

void RepositoryOps::ValidateRepositoryUrl(const std::string& url) {
    auto reject = [&url](const std::string& reason) {
        spdlog::warn("Rejected repository URL ({}): {}", reason, url);
        return SandboxError(ErrorKind::SECURITY_VIOLATION, "Repository URL rejected: " + reason,
                            {{"url", url}});
    };

    if (!utils::StringUtils::StartsWith(url, "https://")) {
        throw reject("only https:// URLs are allowed");
    }

    for (unsigned char c : url) {
        if (std::iscntrl(c) || c >= 0x80) {
            throw reject("non-printable characters");
        }
    }
    if (url.find_first_of(kShellMetacharacters) != std::string::npos) {
        throw reject("shell metacharacters");
    }

    std::string rest = url.substr(8);
    std::string authority = rest.substr(0, rest.find('/'));
    if (authority.empty()) {
        throw reject("missing host");
    }
    if (authority.find('@') != std::string::npos) {
        throw reject("embedded credentials");
    }
    if (authority.front() == '-' || authority.front() == '.' || authority.front() == ':') {
        throw reject("malformed host");
    }
}

void RepositoryOps::ValidateBranch(const std::string& branch) {
    bool valid = !branch.empty() && branch.front() != '-' && branch.front() != '/' &&
                 branch.find("..") == std::string::npos &&
                 std::all_of(branch.begin(), branch.end(), [](unsigned char c) {
                     return std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '/';
                 });
    if (!valid) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Branch name rejected",
                           {{"branch", branch}});
    }
}

void RepositoryOps::ValidateCommit(const std::string& commit) {
    bool valid = commit.size() >= 7 && commit.size() <= 40 &&
                 std::all_of(commit.begin(), commit.end(),
                             [](unsigned char c) { return std::isxdigit(c); });
    if (!valid) {
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Commit must be 7-40 hex digits",
                           {{"commit", commit}});
    }
}

// ============================================================================
// CLONE
// ============================================================================

RepositoryHandle RepositoryOps::Clone(const std::string& url, const CloneOptions& options) {
    // Nothing is created or executed until every input is accepted
    ValidateRepositoryUrl(url);
    if (options.branch) {
        ValidateBranch(*options.branch);
    }
    if (options.commit) {
        ValidateCommit(*options.commit);
    }

    const auto& config = manager_.Config();
    auto timeout = options.timeout.value_or(config.clone_timeout);
    std::string clone_path = NormalizeContainerPath(config.container_workdir + "/" + kCloneDirName);

    spdlog::info("Cloning repository: {}", url);

    auto session = bridge_.CreateSessionDir("repo-");
    std::string clone_container;
    std::string reader_container;

    try {
        auto output = bridge_.CreateOutputDir(session, kCloneDirName);

        ContainerRequest clone_request;
        clone_request.image = config.git_image;
        clone_request.mounts = {output};
        clone_request.environment_vars = {{"HOME", "/tmp"}, {"GIT_TERMINAL_PROMPT", "0"}};
        clone_request.labels = {{"cloister.role", "clone"}};
        clone_request.name_prefix = "cloister-clone";
        clone_request.network_override = NetworkOverride{NetworkMode::BRIDGE, "repository clone"};

        clone_container = manager_.CreateAndStart(clone_request);

        std::vector<std::string> clone_argv = {"git", "clone"};
        if (!options.commit) {
            clone_argv.insert(clone_argv.end(), {"--depth", "1"});
        }
        if (options.branch) {
            clone_argv.insert(clone_argv.end(), {"--branch", *options.branch});
        }
        clone_argv.insert(clone_argv.end(), {"--", url, clone_path});

        RunStep(clone_container, clone_argv, timeout, "git clone");

        // The worktree root is owned by the host user, not the container user
        std::vector<std::string> git_in_clone = {"git", "-c", "safe.directory=*", "-C", clone_path};

        if (options.commit) {
            auto checkout = git_in_clone;
            checkout.insert(checkout.end(), {"checkout", "--detach", *options.commit});
            RunStep(clone_container, checkout, timeout, "git checkout");
        }

        auto rev_parse = git_in_clone;
        rev_parse.insert(rev_parse.end(), {"rev-parse", "HEAD"});
        std::string commit_sha = utils::StringUtils::Trim(
            RunStep(clone_container, rev_parse, timeout, "git rev-parse"));

        // Written by the container user; the host user must be able to delete it
        RunStep(clone_container, {"chmod", "-R", "u+rwX,go+rwX", clone_path}, timeout, "chmod");

        DiscardContainer(clone_container);
        clone_container.clear();

        MountSpec read_only_clone;
        read_only_clone.host_path = output.host_path;
        read_only_clone.container_path = clone_path;
        read_only_clone.read_only = true;

        ContainerRequest reader_request;
        reader_request.image = config.git_image;
        reader_request.mounts = {read_only_clone};
        reader_request.labels = {{"cloister.role", "repository-reader"}};
        reader_request.name_prefix = "cloister-repo";

        reader_container = manager_.CreateAndStart(reader_request);

        RepositoryHandle handle;
        handle.session_dir = session;
        handle.host_path = output.host_path;
        handle.container_path = clone_path;
        handle.container_id = reader_container;
        handle.reference = options.commit ? *options.commit : options.branch.value_or("");
        handle.commit_sha = commit_sha;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            handles_[reader_container] = handle;
        }

        spdlog::info("Repository cloned at {} (HEAD {}), reader container {}",
                     clone_path, commit_sha, reader_container.substr(0, 12));
        return handle;
    }
    catch (const std::exception& e) {
        spdlog::error("Clone of {} failed: {}", url, e.what());

        if (!clone_container.empty()) {
            DiscardContainer(clone_container);
        }
        if (!reader_container.empty()) {
            DiscardContainer(reader_container);
        }
        try {
            bridge_.CleanupSessionDir(session);
        }
        catch (const std::exception& cleanup_error) {
            spdlog::error("Failed to remove clone session {}: {}",
                          session.string(), cleanup_error.what());
        }
        throw;
    }
}

// ============================================================================
// LIST / READ
// ============================================================================

std::vector<std::string> RepositoryOps::ListFiles(const std::string& container_id,
                                                  const std::string& path) {
    auto handle = RequireHandle(container_id);

    if (!FileBridge::IsContainerPathWithin(handle.container_path, path, true)) {
        spdlog::warn("Rejected listing outside repository: {}", path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Path is outside the repository",
                           {{"container_id", container_id}, {"path", path},
                            {"repository", handle.container_path}});
    }

    std::string base = ResolveConfined(handle, path, true);
    auto result = executor_.Execute(container_id,
        {"find", base, "-path", "*/.git", "-prune", "-o", "-type", "f", "-print"});

    if (result.exit_code != 0 ||
        utils::StringUtils::Contains(result.stderr_output, "No such file or directory")) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot list repository path",
                           {{"container_id", container_id}, {"path", base},
                            {"exit_code", std::to_string(result.exit_code)}},
                           utils::StringUtils::Trim(result.stderr_output));
    }

    std::string prefix = base + "/";
    std::vector<std::string> files;
    for (const auto& line : utils::StringUtils::SplitLines(result.stdout_output)) {
        if (utils::StringUtils::StartsWith(line, prefix)) {
            files.push_back(line.substr(prefix.size()));
        }
    }
    std::sort(files.begin(), files.end());

    spdlog::debug("Listed {} file(s) under {}", files.size(), base);
    return files;
}

std::string RepositoryOps::ReadFile(const std::string& container_id, const std::string& path) {
    auto handle = RequireHandle(container_id);

    if (!FileBridge::IsContainerPathWithin(handle.container_path, path, false)) {
        spdlog::warn("Rejected read outside repository: {}", path);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Path is outside the repository",
                           {{"container_id", container_id}, {"path", path},
                            {"repository", handle.container_path}});
    }

    std::string target = ResolveConfined(handle, path, false);
    auto result = executor_.Execute(container_id, {"cat", "--", target});

    if (result.exit_code != 0) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot read repository file",
                           {{"container_id", container_id}, {"path", target},
                            {"exit_code", std::to_string(result.exit_code)}},
                           utils::StringUtils::Trim(result.stderr_output));
    }

    return result.stdout_output;
}

// ============================================================================
// HANDLES
// ============================================================================

std::optional<RepositoryHandle> RepositoryOps::GetHandle(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(container_id);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RepositoryHandle> RepositoryOps::Release(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(container_id);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    RepositoryHandle handle = it->second;
    handles_.erase(it);
    return handle;
}

std::vector<RepositoryHandle> RepositoryOps::Handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RepositoryHandle> handles;
    handles.reserve(handles_.size());
    for (const auto& [id, handle] : handles_) {
        handles.push_back(handle);
    }
    return handles;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

RepositoryHandle RepositoryOps::RequireHandle(const std::string& container_id) const {
    auto handle = GetHandle(container_id);
    if (!handle) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "No repository is open in this container",
                           {{"container_id", container_id}});
    }
    return *handle;
}

std::string RepositoryOps::RunStep(const std::string& container_id,
                                  const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout,
                                  const std::string& step) {
    ExecutionOptions options;
    options.timeout = timeout;

    auto result = executor_.Execute(container_id, argv, options);
    if (result.exit_code != 0) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, step + " failed",
                           {{"container_id", container_id},
                            {"exit_code", std::to_string(result.exit_code)}},
                           utils::StringUtils::Trim(result.stderr_output));
    }
    return result.stdout_output;
}

// Symlinks in the clone are resolved inside the reader before the path is trusted
std::string RepositoryOps::ResolveConfined(const RepositoryHandle& handle, const std::string& path,
                                           bool allow_root) {
    std::string normalized = NormalizeContainerPath(path);
    auto result = executor_.Execute(handle.container_id, {"readlink", "-f", "--", normalized});

    std::string resolved = result.stdout_output;
    while (!resolved.empty() && resolved.back() == '\n') {
        resolved.pop_back();
    }
    if (result.exit_code != 0 || resolved.empty()) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot resolve repository path",
                           {{"container_id", handle.container_id}, {"path", normalized},
                            {"exit_code", std::to_string(result.exit_code)}},
                           utils::StringUtils::Trim(result.stderr_output));
    }

    if (!FileBridge::IsContainerPathWithin(handle.container_path, resolved, allow_root)) {
        spdlog::warn("Rejected path resolving outside repository: {} -> {}", normalized, resolved);
        throw SandboxError(ErrorKind::SECURITY_VIOLATION, "Path resolves outside the repository",
                           {{"container_id", handle.container_id}, {"path", normalized},
                            {"resolved", resolved}, {"repository", handle.container_path}});
    }
    return NormalizeContainerPath(resolved);
}

void RepositoryOps::DiscardContainer(const std::string& container_id) {
    manager_.Stop(container_id);
    if (manager_.Remove(container_id)) {
        manager_.Forget(container_id);
    }
}

} // namespace core
} // namespace cloister
