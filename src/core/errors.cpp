/**
 * @file errors.cpp
 * @brief Implementation of engine error taxonomy and classification
 *
 * **Severity Table**:
 * ```
 * SECURITY_VIOLATION              → FATAL                          → HALT
 * COMMAND_TIMEOUT, RESOURCE_LIMIT → RECOVERABLE_WITH_MODIFICATION  → RETRY_SUBTASK_MODIFIED
 * COMMAND_EXECUTION               → CRITICAL                       → RETRY_SUBTASK_MODIFIED
 * everything else                 → CRITICAL                       → HALT
 * ```
 *
 * @date 2025
 */

#include "cloister/core/errors.hpp"

#include <sstream>

namespace cloister {
namespace core {

namespace {

std::string BuildWhat(ErrorKind kind, const std::string& message, const std::string& cause) {
    std::string what = "[" + ErrorCode(kind) + "] " + message;
    if (!cause.empty()) {
        what += " (cause: " + cause + ")";
    }
    return what;
}

} // anonymous namespace

// ============================================================================
// SANDBOX ERROR
// ============================================================================

SandboxError::SandboxError(ErrorKind kind,
                           const std::string& message,
                           ErrorContext context,
                           std::string cause)
    : std::runtime_error(BuildWhat(kind, message, cause))
    , kind_(kind)
    , message_(message)
    , context_(std::move(context))
    , cause_(std::move(cause)) {
}

std::string SandboxError::Code() const {
    return ErrorCode(kind_);
}

Severity SandboxError::GetSeverity() const {
    return DefaultSeverity(kind_);
}

// ============================================================================
// CODES AND NAMES
// ============================================================================

std::string ErrorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONTAINER_CREATION: return "CONTAINER_CREATION_ERROR";
        case ErrorKind::COMMAND_EXECUTION: return "COMMAND_EXECUTION_ERROR";
        case ErrorKind::COMMAND_TIMEOUT: return "COMMAND_TIMEOUT_ERROR";
        case ErrorKind::FILE_SYSTEM: return "FILE_SYSTEM_ERROR";
        case ErrorKind::SECURITY_VIOLATION: return "SECURITY_VIOLATION_ERROR";
        case ErrorKind::RESOURCE_LIMIT: return "RESOURCE_LIMIT_ERROR";
        case ErrorKind::CONFIGURATION:
        default: return "SANDBOX_GENERIC";
    }
}

Severity DefaultSeverity(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SECURITY_VIOLATION:
            return Severity::FATAL;
        case ErrorKind::COMMAND_TIMEOUT:
        case ErrorKind::RESOURCE_LIMIT:
            return Severity::RECOVERABLE_WITH_MODIFICATION;
        default:
            return Severity::CRITICAL;
    }
}

std::string ToString(Severity severity) {
    switch (severity) {
        case Severity::FATAL: return "FATAL";
        case Severity::CRITICAL: return "CRITICAL";
        case Severity::RECOVERABLE_WITH_MODIFICATION: return "RECOVERABLE_WITH_MODIFICATION";
        case Severity::RETRYABLE_TRANSIENT: return "RETRYABLE_TRANSIENT";
        case Severity::WARNING: return "WARNING";
    }
    return "UNKNOWN";
}

std::string ToString(SuggestedAction action) {
    switch (action) {
        case SuggestedAction::HALT: return "HALT";
        case SuggestedAction::RETRY_SUBTASK_MODIFIED: return "RETRY_SUBTASK_MODIFIED";
        case SuggestedAction::RETRY_SUBTASK_AS_IS: return "RETRY_SUBTASK_AS_IS";
        case SuggestedAction::LOG_AND_CONTINUE: return "LOG_AND_CONTINUE";
    }
    return "UNKNOWN";
}

std::string FormatContext(const ErrorContext& context) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : context) {
        if (!first) {
            oss << ", ";
        }
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

ErrorClassification ClassifyError(const SandboxError& error, bool optional_task) {
    ErrorClassification classification;
    classification.severity = error.GetSeverity();
    classification.context = error.Context();

    switch (error.Kind()) {
        case ErrorKind::SECURITY_VIOLATION:
            classification.suggested_action = SuggestedAction::HALT;
            classification.details = "Security violation: " + error.Message();
            break;
        case ErrorKind::COMMAND_TIMEOUT:
        case ErrorKind::RESOURCE_LIMIT:
        case ErrorKind::COMMAND_EXECUTION:
            classification.suggested_action = SuggestedAction::RETRY_SUBTASK_MODIFIED;
            classification.details = error.Code() + ": " + error.Message();
            break;
        default:
            classification.suggested_action = SuggestedAction::HALT;
            classification.details = error.Code() + ": " + error.Message();
            break;
    }

    if (optional_task && classification.severity == Severity::CRITICAL) {
        classification.severity = Severity::WARNING;
        classification.suggested_action = SuggestedAction::LOG_AND_CONTINUE;
    }

    classification.is_retryable =
        classification.suggested_action == SuggestedAction::RETRY_SUBTASK_MODIFIED ||
        classification.suggested_action == SuggestedAction::RETRY_SUBTASK_AS_IS;

    return classification;
}

ErrorClassification ClassifyError(const std::exception& error, bool optional_task) {
    if (const auto* sandbox_error = dynamic_cast<const SandboxError*>(&error)) {
        return ClassifyError(*sandbox_error, optional_task);
    }

    ErrorClassification classification;
    classification.details = std::string("Unclassified error: ") + error.what();
    if (optional_task) {
        classification.severity = Severity::WARNING;
        classification.suggested_action = SuggestedAction::LOG_AND_CONTINUE;
    }
    return classification;
}

} // namespace core
} // namespace cloister
