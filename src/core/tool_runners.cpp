/**
 * @file tool_runners.cpp
 * @brief Implementation of tool runners and their registry
 *
 * @date 2025
 */

#include "cloister/core/tool_runners.hpp"
#include "cloister/core/errors.hpp"
#include "cloister/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloister {
namespace core {

// ============================================================================
// TOOL RUNNER
// ============================================================================

ExecutionResult ToolRunner::Run(CommandExecutor& executor,
                                const std::string& container_id,
                                const std::string& workdir) const {
    ExecutionOptions options;
    options.working_dir = workdir;
    options.environment_vars = {{"HOME", "/tmp"}, {"PYTHONDONTWRITEBYTECODE", "1"}};

    spdlog::info("Running {} in {} ({})", Name(), container_id.substr(0, 12), workdir);

    auto result = executor.Execute(container_id, BuildArgv(workdir), options);

    spdlog::info("{} finished with exit code {} in {} ms",
                 Name(), result.exit_code, result.duration.count());
    return result;
}

ExecToolRunner::ExecToolRunner(std::string name, std::string description,
                               std::vector<std::string> argv, bool target_cwd)
    : name_(std::move(name))
    , description_(std::move(description))
    , argv_(std::move(argv))
    , target_cwd_(target_cwd) {
}

std::vector<std::string> ExecToolRunner::BuildArgv(const std::string& /*workdir*/) const {
    std::vector<std::string> argv = argv_;
    if (target_cwd_) {
        argv.push_back(".");
    }
    return argv;
}

PytestRunner::PytestRunner()
    : ExecToolRunner("pytest", "Run Python tests with pytest",
                     {"python", "-m", "pytest", "-q", "-p", "no:cacheprovider"}, true) {
}

Flake8Runner::Flake8Runner()
    : ExecToolRunner("flake8", "Lint Python sources with flake8",
                     {"python", "-m", "flake8"}, true) {
}

EslintRunner::EslintRunner()
    : ExecToolRunner("eslint", "Lint JavaScript sources with ESLint",
                     {"npx", "--no-install", "eslint"}, true) {
}

NpmTestRunner::NpmTestRunner()
    : ExecToolRunner("npm-test", "Run the npm test script",
                     {"npm", "test", "--silent"}, false) {
}

// ============================================================================
// REGISTRY
// ============================================================================

ToolRegistry ToolRegistry::WithDefaults() {
    ToolRegistry registry;
    registry.Register(std::make_unique<PytestRunner>());
    registry.Register(std::make_unique<Flake8Runner>());
    registry.Register(std::make_unique<EslintRunner>());
    registry.Register(std::make_unique<NpmTestRunner>());
    return registry;
}

void ToolRegistry::Register(std::unique_ptr<ToolRunner> runner) {
    auto name = runner->Name();
    runners_[name] = std::move(runner);
}

const ToolRunner* ToolRegistry::Get(const std::string& name) const {
    auto it = runners_.find(name);
    if (it == runners_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return runners_.find(name) != runners_.end();
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : runners_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

ExecutionResult ToolRegistry::Run(const std::string& name,
                                  CommandExecutor& executor,
                                  const std::string& container_id,
                                  const std::string& workdir) const {
    auto runner = Get(name);
    if (!runner) {
        throw SandboxError(ErrorKind::COMMAND_EXECUTION, "Unknown tool: " + name,
                           {{"tool", name},
                            {"available", utils::StringUtils::Join(List(), ",")}});
    }
    return runner->Run(executor, container_id, workdir);
}

} // namespace core
} // namespace cloister
