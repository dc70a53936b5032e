/**
 * @file tool_runners.hpp
 * @brief Linters and test runners executed inside sandbox containers
 *
 * A tool runner turns a working directory into a fixed argv and runs it
 * through the command executor. The registry maps tool names to runners so
 * callers can select tools by name.
 *
 * @date 2025
 */

#pragma once

#include "cloister/core/command_executor.hpp"
#include "cloister/core/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloister {
namespace core {

/**
 * @class ToolRunner
 * @brief Capability interface for one tool
 */
class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;

    /// Command line for a working directory inside the container
    virtual std::vector<std::string> BuildArgv(const std::string& workdir) const = 0;

    /**
     * @brief Run the tool; the exit code is returned verbatim
     *
     * HOME points at the /tmp tmpfs and bytecode writes are disabled, since
     * mounted sources are read-only.
     *
     * @throws SandboxError as CommandExecutor::Execute
     */
    virtual ExecutionResult Run(CommandExecutor& executor,
                                const std::string& container_id,
                                const std::string& workdir) const;
};

/**
 * @class ExecToolRunner
 * @brief Runner defined by a fixed argv prefix
 *
 * Arguments are passed as given; the working directory becomes the exec cwd
 * and `.` is appended when `target_cwd` is set.
 */
class ExecToolRunner : public ToolRunner {
public:
    ExecToolRunner(std::string name, std::string description,
                   std::vector<std::string> argv, bool target_cwd);

    std::string Name() const override { return name_; }
    std::string Description() const override { return description_; }
    std::vector<std::string> BuildArgv(const std::string& workdir) const override;

private:
    std::string name_;
    std::string description_;
    std::vector<std::string> argv_;
    bool target_cwd_;
};

/// `python -m pytest -q -p no:cacheprovider .`
class PytestRunner : public ExecToolRunner {
public:
    PytestRunner();
};

/// `python -m flake8 .`
class Flake8Runner : public ExecToolRunner {
public:
    Flake8Runner();
};

/// `npx --no-install eslint .`
class EslintRunner : public ExecToolRunner {
public:
    EslintRunner();
};

/// `npm test --silent`
class NpmTestRunner : public ExecToolRunner {
public:
    NpmTestRunner();
};

/**
 * @class ToolRegistry
 * @brief Name to runner map
 */
class ToolRegistry {
public:
    /// Registry pre-populated with pytest, flake8, eslint and npm-test
    static ToolRegistry WithDefaults();

    void Register(std::unique_ptr<ToolRunner> runner);
    const ToolRunner* Get(const std::string& name) const;
    bool Has(const std::string& name) const;

    /// Sorted tool names
    std::vector<std::string> List() const;

    /**
     * @brief Run a tool by name
     * @throws SandboxError(COMMAND_EXECUTION) for an unknown name
     */
    ExecutionResult Run(const std::string& name,
                        CommandExecutor& executor,
                        const std::string& container_id,
                        const std::string& workdir) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ToolRunner>> runners_;
};

} // namespace core
} // namespace cloister
