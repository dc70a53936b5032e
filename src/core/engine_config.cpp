/**
 * @file engine_config.cpp
 * @brief JSON configuration parsing and validation
 *
 * @date 2025
 */

#include "cloister/core/engine_config.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/container_utils.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace cloister {
namespace core {

namespace {

SandboxError ConfigError(const std::string& message, const std::string& key,
                         const std::string& cause = {}) {
    return SandboxError(ErrorKind::CONFIGURATION, message, {{"option", key}}, cause);
}

std::string NormalizeExtension(const std::string& ext) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(ext));
    if (!lowered.empty() && lowered.front() != '.') {
        lowered.insert(lowered.begin(), '.');
    }
    return lowered;
}

std::set<std::string> ReadExtensionList(const json& j, const std::string& key) {
    if (!j.is_array()) {
        throw ConfigError("Expected an array of extensions", key);
    }
    std::set<std::string> extensions;
    for (const auto& item : j) {
        extensions.insert(NormalizeExtension(item.get<std::string>()));
    }
    return extensions;
}

} // anonymous namespace

// ============================================================================
// MEMORY LIMIT PARSING
// ============================================================================

std::uint64_t ParseMemoryLimit(const std::string& value) {
    std::string text = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (text.empty()) {
        throw ConfigError("Memory limit is empty", "memory");
    }

    std::uint64_t multiplier = 1;
    switch (text.back()) {
        case 'b': multiplier = 1; text.pop_back(); break;
        case 'k': multiplier = 1024ull; text.pop_back(); break;
        case 'm': multiplier = 1024ull * 1024; text.pop_back(); break;
        case 'g': multiplier = 1024ull * 1024 * 1024; text.pop_back(); break;
        default: break;
    }

    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid memory limit format: " + value, "memory");
    }

    std::uint64_t amount = 0;
    try {
        amount = std::stoull(text);
    }
    catch (const std::exception& e) {
        throw ConfigError("Invalid memory limit format: " + value, "memory", e.what());
    }

    if (amount == 0) {
        throw ConfigError("Memory limit must be greater than zero", "memory");
    }
    if (amount > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw ConfigError("Memory limit overflows: " + value, "memory");
    }

    return amount * multiplier;
}

// ============================================================================
// CONFIG PARSING
// ============================================================================

EngineConfig ParseConfig(const std::string& json_text) {
    EngineConfig config;

    json j;
    try {
        j = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw ConfigError("Configuration is not valid JSON", "<document>", e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Configuration root must be an object", "<document>");
    }

    try {
        config.base_image = j.value("baseImage", config.base_image);
        config.git_image = j.value("gitImage", config.git_image);
        config.pull_missing_images = j.value("pullMissingImages", config.pull_missing_images);

        if (j.contains("tempHostDir")) {
            config.temp_host_dir = j["tempHostDir"].get<std::string>();
        }

        if (j.contains("defaultResourceLimits")) {
            const auto& limits = j["defaultResourceLimits"];
            config.default_resource_limits.cpus =
                limits.value("cpus", config.default_resource_limits.cpus);
            config.default_resource_limits.pids =
                limits.value("pids", config.default_resource_limits.pids);
            if (limits.contains("memory")) {
                const auto& memory = limits["memory"];
                config.default_resource_limits.memory_bytes = memory.is_number_unsigned()
                    ? memory.get<std::uint64_t>()
                    : ParseMemoryLimit(memory.get<std::string>());
            }
        }

        config.default_network_mode = j.value("defaultNetworkMode", config.default_network_mode);
        config.container_user = j.value("containerUser", config.container_user);
        config.container_workdir = j.value("containerWorkdir", config.container_workdir);

        if (j.contains("stopGracePeriodSec")) {
            config.stop_grace_period = std::chrono::seconds(j["stopGracePeriodSec"].get<long>());
        }
        if (j.contains("commandTimeoutMs")) {
            config.command_timeout = std::chrono::milliseconds(j["commandTimeoutMs"].get<long>());
        }
        if (j.contains("cloneTimeoutMs")) {
            config.clone_timeout = std::chrono::milliseconds(j["cloneTimeoutMs"].get<long>());
        }
        config.max_output_bytes = j.value("maxOutputBytes", config.max_output_bytes);

        if (j.contains("allowedExtensions")) {
            config.allowed_extensions = ReadExtensionList(j["allowedExtensions"], "allowedExtensions");
        }
        if (j.contains("blockedExtensions")) {
            config.blocked_extensions = ReadExtensionList(j["blockedExtensions"], "blockedExtensions");
        }
        config.max_file_size_bytes = j.value("maxFileSizeBytes", config.max_file_size_bytes);
        config.max_file_count = j.value("maxFileCount", config.max_file_count);

        config.docker_binary = j.value("dockerBinary", config.docker_binary);
        config.log_level = j.value("logLevel", config.log_level);
    }
    catch (const json::exception& e) {
        throw ConfigError("Configuration value has the wrong type", "<document>", e.what());
    }

    ValidateConfig(config);
    return config;
}

EngineConfig LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string(), "<file>");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading configuration from {}", path.string());
    return ParseConfig(buffer.str());
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const EngineConfig& config) {
    if (config.base_image.empty()) {
        throw ConfigError("Base image is required", "baseImage");
    }
    if (config.temp_host_dir.empty() || !config.temp_host_dir.is_absolute()) {
        throw ConfigError("tempHostDir must be an absolute path", "tempHostDir");
    }
    if (config.default_resource_limits.cpus <= 0.0) {
        throw ConfigError("CPU quota must be greater than zero", "defaultResourceLimits.cpus");
    }
    if (config.default_resource_limits.memory_bytes == 0) {
        throw ConfigError("Memory limit must be greater than zero", "defaultResourceLimits.memory");
    }
    if (config.default_resource_limits.pids <= 0) {
        throw ConfigError("Process limit must be greater than zero", "defaultResourceLimits.pids");
    }
    if (config.default_network_mode != "none") {
        throw ConfigError("Only the isolated network mode \"none\" is supported",
                          "defaultNetworkMode");
    }
    if (utils::IsRootUser(config.container_user)) {
        throw ConfigError("Container user must be non-root", "containerUser");
    }
    if (config.command_timeout.count() <= 0) {
        throw ConfigError("Command timeout must be greater than zero", "commandTimeoutMs");
    }
    if (config.clone_timeout.count() <= 0) {
        throw ConfigError("Clone timeout must be greater than zero", "cloneTimeoutMs");
    }
    if (config.max_file_count == 0) {
        throw ConfigError("maxFileCount must be greater than zero", "maxFileCount");
    }
}

// ============================================================================
// LOGGING
// ============================================================================

void ApplyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(utils::StringUtils::ToLower(level));
    if (parsed == spdlog::level::off && utils::StringUtils::ToLower(level) != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

} // namespace core
} // namespace cloister
