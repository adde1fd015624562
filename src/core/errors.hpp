#pragma once

#include <stdexcept>
#include <string>

namespace codebox {

class CodeboxError : public std::runtime_error {
public:
    explicit CodeboxError(const std::string& message)
        : std::runtime_error(message) {}
};

// Unknown project, file, execution or environment id.
class NotFoundError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Id (or unique key) collision on create.
class DuplicateError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Storage backend malfunction.
class StorageError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Sandbox failed to start, stop or run.
class ExecutionError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Invalid or exceeded resource limits.
class ResourceError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Package manager exited non-zero. Output() holds the captured stderr.
class DependencyError : public CodeboxError {
public:
    DependencyError(const std::string& message, std::string output)
        : CodeboxError(message), output_(std::move(output)) {}

    const std::string& Output() const { return output_; }

private:
    std::string output_;
};

// Disallowed dependency specifier or path.
class SecurityError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

// Environment could not be created.
class EnvironmentError : public CodeboxError {
public:
    using CodeboxError::CodeboxError;
};

}  // namespace codebox
