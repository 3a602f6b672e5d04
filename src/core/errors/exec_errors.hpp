#pragma once
#include <string>
#include <utility>
#include <variant>

namespace synx::core::errors {

    // 1. Flat, terminal failure taxonomy. Nothing is retried internally.
    enum class ErrorKind {
        ProgramNotFound,
        ProgramNotExecutable,
        UnsafeArgument,
        PathNotAllowed,
        EnvModificationDenied,
        PolicyInstallFailed,
        LaunchFailed,
        Timeout,
        IoError,
        InvalidPolicy,  // E.g., zero timeout or malformed policy file
        InvalidInput    // E.g., unknown CLI flag
    };

    // The standardized error payload
    struct ExecError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ProgramNotFound:       return "program_not_found";
            case ErrorKind::ProgramNotExecutable:  return "program_not_executable";
            case ErrorKind::UnsafeArgument:        return "unsafe_argument";
            case ErrorKind::PathNotAllowed:        return "path_not_allowed";
            case ErrorKind::EnvModificationDenied: return "env_modification_denied";
            case ErrorKind::PolicyInstallFailed:   return "policy_install_failed";
            case ErrorKind::LaunchFailed:          return "launch_failed";
            case ErrorKind::Timeout:               return "timeout";
            case ErrorKind::IoError:               return "io_error";
            case ErrorKind::InvalidPolicy:         return "invalid_policy";
            case ErrorKind::InvalidInput:          return "invalid_input";
            default: return "unknown_error";
        }
    }

    // Builds an error whose code mirrors its kind.
    inline ExecError make_error(ErrorKind kind, std::string message,
                                std::string hint = "") {
        return ExecError{kind, std::move(message), to_string(kind), std::move(hint)};
    }

    // Sanitizer rejections: the caller asked for something the policy forbids.
    inline bool is_validation_error(const ExecError& error) {
        switch (error.kind) {
            case ErrorKind::ProgramNotFound:
            case ErrorKind::ProgramNotExecutable:
            case ErrorKind::UnsafeArgument:
            case ErrorKind::PathNotAllowed:
            case ErrorKind::EnvModificationDenied:
                return true;
            default:
                return false;
        }
    }

    // 2. Propagation strategy: a Result holds either a value of type T, OR an ExecError.
    template <typename T>
    using Result = std::variant<T, ExecError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ExecError>(result);
    }

    template <typename T>
    const ExecError& get_error(const Result<T>& result) {
        return std::get<ExecError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // Unit type for operations that only succeed or fail.
    struct Ok {};

} // namespace synx::core::errors
