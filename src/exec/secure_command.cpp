#include "exec/secure_command.hpp"

#include "policy/input_sanitizer.hpp"

namespace synx::exec {

using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using policy::ExecutionPolicy;
using policy::InputSanitizer;

SecureCommand::SecureCommand(std::filesystem::path program,
                             ExecutionPolicy execution_policy)
    : program_(std::move(program)), policy_(std::move(execution_policy)) {}

core::errors::Result<SecureCommand> SecureCommand::create(
    const std::filesystem::path& program, ExecutionPolicy execution_policy) {
    auto validated_policy = policy::validate_policy(std::move(execution_policy));
    if (is_error(validated_policy)) {
        return get_error(validated_policy);
    }

    const InputSanitizer sanitizer;
    auto validated_program = sanitizer.validate_program(program);
    if (is_error(validated_program)) {
        return get_error(validated_program);
    }

    return SecureCommand(get_value(validated_program), get_value(validated_policy));
}

core::errors::Result<SecureCommand> SecureCommand::arg(const std::string& argument) const {
    const InputSanitizer sanitizer;
    auto validated = sanitizer.validate_argument(argument);
    if (is_error(validated)) {
        return get_error(validated);
    }

    SecureCommand next = *this;
    next.args_.push_back(get_value(validated));
    return next;
}

core::errors::Result<SecureCommand> SecureCommand::args(
    const std::vector<std::string>& arguments) const {
    const InputSanitizer sanitizer;
    SecureCommand next = *this;
    for (const auto& argument : arguments) {
        auto validated = sanitizer.validate_argument(argument);
        if (is_error(validated)) {
            return get_error(validated);
        }
        next.args_.push_back(get_value(validated));
    }
    return next;
}

core::errors::Result<SecureCommand> SecureCommand::current_dir(
    const std::filesystem::path& working_dir) const {
    const InputSanitizer sanitizer;
    auto validated = sanitizer.validate_working_dir(working_dir, policy_.allowed_paths);
    if (is_error(validated)) {
        return get_error(validated);
    }

    SecureCommand next = *this;
    next.working_dir_ = get_value(validated);
    return next;
}

core::errors::Result<SecureCommand> SecureCommand::env(const std::string& key,
                                                       const std::string& value) const {
    const InputSanitizer sanitizer;
    auto validated = sanitizer.validate_env(key, value, policy_.restrictions);
    if (is_error(validated)) {
        return get_error(validated);
    }

    SecureCommand next = *this;
    next.env_.push_back(get_value(validated));
    return next;
}

bool SecureCommand::operator==(const SecureCommand& other) const {
    return program_ == other.program_ && args_ == other.args_ &&
           working_dir_ == other.working_dir_ && env_ == other.env_ &&
           policy_ == other.policy_;
}

}  // namespace synx::exec
