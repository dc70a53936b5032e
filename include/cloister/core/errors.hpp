/**
 * @file errors.hpp
 * @brief Typed failures raised by the sandbox engine
 *
 * Every rejected operation surfaces as a SandboxError tagged with an
 * ErrorKind, so callers can tell "fix the input and retry" apart from
 * "abort and escalate" without parsing messages. Each error carries the
 * originating cause and structured context (container id, path, command)
 * for logging.
 *
 * @date 2025
 */

#pragma once

#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace cloister {
namespace core {

/**
 * @enum ErrorKind
 * @brief Failure taxonomy of the engine
 */
enum class ErrorKind {
    CONTAINER_CREATION,   ///< Runtime refused to create/start a container
    COMMAND_EXECUTION,    ///< Exec could not run (dead container, runtime failure)
    COMMAND_TIMEOUT,      ///< Exec exceeded its deadline and was killed
    FILE_SYSTEM,          ///< Host or container filesystem operation failed
    SECURITY_VIOLATION,   ///< Path/URL outside the sanctioned boundary
    RESOURCE_LIMIT,       ///< Input or request exceeded configured bounds
    CONFIGURATION         ///< Invalid engine configuration
};

/**
 * @enum Severity
 * @brief How bad an error is for the orchestrating task
 */
enum class Severity {
    FATAL,                           ///< Never retry; escalate
    CRITICAL,                        ///< Task cannot proceed as-is
    RECOVERABLE_WITH_MODIFICATION,   ///< Retry with changed parameters
    RETRYABLE_TRANSIENT,             ///< Retry unchanged
    WARNING                          ///< Log and continue
};

/**
 * @enum SuggestedAction
 * @brief What the orchestrator should do next
 */
enum class SuggestedAction {
    HALT,
    RETRY_SUBTASK_MODIFIED,
    RETRY_SUBTASK_AS_IS,
    LOG_AND_CONTINUE
};

/// Structured key/value context attached to errors (container_id, path, ...)
using ErrorContext = std::map<std::string, std::string>;

/**
 * @class SandboxError
 * @brief Single exception type carrying a kind tag plus context
 *
 * **Usage Example**:
 * @code
 * try {
 *     engine.ExecuteCommand(id, {"python", "main.py"});
 * } catch (const SandboxError& e) {
 *     if (e.Kind() == ErrorKind::COMMAND_TIMEOUT) {
 *         // retry with a longer timeout
 *     }
 *     spdlog::error("{} context={}", e.what(), FormatContext(e.Context()));
 * }
 * @endcode
 */
class SandboxError : public std::runtime_error {
public:
    /**
     * @brief Construct error
     * @param kind Failure kind
     * @param message Human-readable description
     * @param context Structured context fields
     * @param cause Originating error text (runtime stderr, errno message, ...)
     */
    SandboxError(ErrorKind kind,
                 const std::string& message,
                 ErrorContext context = {},
                 std::string cause = {});

    ErrorKind Kind() const noexcept { return kind_; }
    const std::string& Message() const noexcept { return message_; }
    const ErrorContext& Context() const noexcept { return context_; }
    const std::string& Cause() const noexcept { return cause_; }

    /// Stable machine-readable code, e.g. "SECURITY_VIOLATION_ERROR"
    std::string Code() const;

    /// Default severity of this kind
    Severity GetSeverity() const;

private:
    ErrorKind kind_;
    std::string message_;
    ErrorContext context_;
    std::string cause_;
};

/**
 * @struct ErrorClassification
 * @brief Recovery guidance derived from an error
 */
struct ErrorClassification {
    Severity severity{Severity::CRITICAL};
    bool is_retryable{false};
    SuggestedAction suggested_action{SuggestedAction::HALT};
    std::string details;
    ErrorContext context;
};

/// Machine-readable code of a kind
std::string ErrorCode(ErrorKind kind);

/// Default severity of a kind
Severity DefaultSeverity(ErrorKind kind);

std::string ToString(Severity severity);
std::string ToString(SuggestedAction action);

/// Render context as `key=value, key=value`
std::string FormatContext(const ErrorContext& context);

/**
 * @brief Map an engine error to recovery guidance
 *
 * Security violations halt. Timeouts and resource limits ask for a modified
 * retry. For optional tasks, CRITICAL errors are downgraded to a warning.
 *
 * @param error Engine error
 * @param optional_task Whether the failing task may be skipped
 * @return Classification
 */
ErrorClassification ClassifyError(const SandboxError& error, bool optional_task = false);

/**
 * @brief Classify an arbitrary exception (non-engine errors are CRITICAL)
 */
ErrorClassification ClassifyError(const std::exception& error, bool optional_task = false);

} // namespace core
} // namespace cloister
