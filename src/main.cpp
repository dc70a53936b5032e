/**
 * @file main.cpp
 * @brief Cloister sandbox engine - Command-line interface
 *
 * Operator tool around the sandbox engine: run a command against staged
 * files, clone and inspect a repository, run a linter or test tool on a
 * host directory, and list or reap orphaned containers.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "cloister/core/engine_config.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/core/sandbox_engine.hpp"
#include "cloister/utils/container_utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

using cloister::core::ErrorKind;
using cloister::core::SandboxError;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadHostFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SandboxError(ErrorKind::FILE_SYSTEM, "Cannot read host file", {{"path", path.string()}});
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// "rel=hostpath" pairs from --file
std::map<std::string, std::string> LoadFileArguments(const std::vector<std::string>& specs) {
    std::map<std::string, std::string> files;
    for (const auto& spec : specs) {
        auto separator = spec.find('=');
        if (separator == std::string::npos || separator == 0 || separator + 1 == spec.size()) {
            throw SandboxError(ErrorKind::CONFIGURATION, "Expected --file RELATIVE=HOSTPATH",
                               {{"argument", spec}});
        }
        files[spec.substr(0, separator)] = ReadHostFile(spec.substr(separator + 1));
    }
    return files;
}

// Every regular file below dir, keyed by its relative path; .git is skipped
std::map<std::string, std::string> LoadDirectory(const fs::path& dir) {
    std::map<std::string, std::string> files;
    for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory() && it->path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file()) {
            files[fs::relative(it->path(), dir).generic_string()] = ReadHostFile(it->path());
        }
    }
    return files;
}

int PrintExecution(const cloister::core::ExecutionResult& result, bool as_json) {
    if (as_json) {
        json j;
        j["exit_code"] = result.exit_code;
        j["stdout"] = result.stdout_output;
        j["stderr"] = result.stderr_output;
        j["duration_ms"] = result.duration.count();
        j["output_truncated"] = result.output_truncated;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << result.stdout_output;
        std::cerr << result.stderr_output;
        spdlog::info("Exit code: {} ({} ms)", result.exit_code, result.duration.count());
    }
    return result.exit_code;
}

void ReportSandboxError(const SandboxError& e) {
    auto classification = cloister::core::ClassifyError(e);
    spdlog::error("[{}] {}", e.Code(), e.Message());
    if (!e.Context().empty()) {
        spdlog::error("  Context: {}", cloister::core::FormatContext(e.Context()));
    }
    if (!e.Cause().empty()) {
        spdlog::error("  Cause: {}", e.Cause());
    }
    spdlog::error("  Severity: {}, suggested action: {}",
                  cloister::core::ToString(classification.severity),
                  cloister::core::ToString(classification.suggested_action));
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Cloister - sandboxed execution of untrusted code"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    bool as_json = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--json", as_json, "Print results as JSON");

    // run
    auto* run_cmd = app.add_subcommand("run", "Run a command in a fresh sandbox container");
    std::string run_image;
    std::vector<std::string> run_files;
    std::string run_output;
    long run_timeout_ms = 0;
    std::vector<std::string> run_argv;
    run_cmd->add_option("--image", run_image, "Container image (default: config baseImage)");
    run_cmd->add_option("-f,--file", run_files, "Stage a file: RELATIVE=HOSTPATH");
    run_cmd->add_option("-o,--output", run_output,
                        "Writable output directory, copied to the current directory afterwards");
    run_cmd->add_option("-t,--timeout", run_timeout_ms, "Command timeout in milliseconds");
    run_cmd->add_option("command", run_argv, "Command and arguments (after --)")->required();

    // clone
    auto* clone_cmd = app.add_subcommand("clone", "Clone a repository and inspect it");
    std::string clone_url;
    std::string clone_branch;
    std::string clone_commit;
    bool clone_list = false;
    std::string clone_read;
    clone_cmd->add_option("url", clone_url, "https:// repository URL")->required();
    clone_cmd->add_option("-b,--branch", clone_branch, "Branch to clone");
    clone_cmd->add_option("--commit", clone_commit, "Commit to check out");
    clone_cmd->add_flag("-l,--list", clone_list, "List repository files");
    clone_cmd->add_option("-r,--read", clone_read, "Print a file (path relative to the clone)");

    // tool
    auto* tool_cmd = app.add_subcommand("tool", "Run a linter or test tool on a host directory");
    std::string tool_name;
    std::string tool_dir;
    std::string tool_image;
    tool_cmd->add_option("name", tool_name, "Tool: pytest, flake8, eslint, npm-test")->required();
    tool_cmd->add_option("-d,--dir", tool_dir, "Host directory to stage")
        ->required()
        ->check(CLI::ExistingDirectory);
    tool_cmd->add_option("--image", tool_image, "Container image (default: config baseImage)");

    // orphans
    auto* orphans_cmd = app.add_subcommand("orphans", "List containers left behind by earlier runs");
    bool orphans_reap = false;
    orphans_cmd->add_flag("--reap", orphans_reap, "Stop and remove the orphans");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto config = config_path.empty() ? cloister::core::EngineConfig{}
                                          : cloister::core::LoadConfig(config_path);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            cloister::core::ApplyLogLevel(config.log_level);
        }

        cloister::core::SandboxEngine engine(config);
        int exit_code = 0;

        if (*run_cmd) {
            auto session = engine.CreateSession("run-");

            cloister::core::ContainerRequest request;
            request.image = run_image;
            request.mounts = engine.PrepareFiles(session, LoadFileArguments(run_files));
            if (!run_output.empty()) {
                request.mounts.push_back(engine.CreateOutputDir(session, run_output));
            }

            auto container_id = engine.CreateAndStartContainer(request);

            cloister::core::ExecutionOptions options;
            if (run_timeout_ms > 0) {
                options.timeout = std::chrono::milliseconds(run_timeout_ms);
            }
            exit_code = PrintExecution(engine.ExecuteCommand(container_id, run_argv, options), as_json);

            // Session dirs are removed with the engine; copy outputs out first
            if (!run_output.empty()) {
                fs::copy(session / run_output, fs::current_path() / run_output,
                         fs::copy_options::recursive | fs::copy_options::overwrite_existing);
                spdlog::info("Output copied to: {}", (fs::current_path() / run_output).string());
            }
        }
        else if (*clone_cmd) {
            cloister::core::CloneOptions options;
            if (!clone_branch.empty()) {
                options.branch = clone_branch;
            }
            if (!clone_commit.empty()) {
                options.commit = clone_commit;
            }

            auto handle = engine.CloneRepository(clone_url, options);
            spdlog::info("HEAD: {}", handle.commit_sha);

            if (clone_list) {
                auto files = engine.ListRepositoryFiles(handle.container_id, handle.container_path);
                if (as_json) {
                    std::cout << json(files).dump(2) << std::endl;
                } else {
                    for (const auto& file : files) {
                        std::cout << file << "\n";
                    }
                }
            }
            if (!clone_read.empty()) {
                std::cout << engine.ReadRepositoryFile(handle.container_id,
                                                       handle.container_path + "/" + clone_read);
            }
        }
        else if (*tool_cmd) {
            auto session = engine.CreateSession("tool-");

            cloister::core::ContainerRequest request;
            request.image = tool_image;
            request.mounts = engine.PrepareFiles(session, LoadDirectory(tool_dir));

            auto container_id = engine.CreateAndStartContainer(request);
            exit_code = PrintExecution(
                engine.RunTool(tool_name, container_id, config.container_workdir), as_json);
        }
        else if (*orphans_cmd) {
            auto orphans = engine.FindOrphans();
            if (as_json) {
                std::cout << json(orphans).dump(2) << std::endl;
            } else {
                for (const auto& id : orphans) {
                    std::cout << id << "\n";
                }
            }

            if (orphans_reap) {
                for (const auto& id : orphans) {
                    if (!engine.ReapOrphan(id)) {
                        exit_code = 1;
                    }
                }
            }
        }

        return exit_code;

    } catch (const SandboxError& e) {
        ReportSandboxError(e);
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
