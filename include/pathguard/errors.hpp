#pragma once

/**
 * @file errors.hpp
 * @brief Reason codes, error type and Result<T> used across pathguard
 *
 * Every fallible operation returns a Result<T, SecurityError>. A SecurityError
 * carries one closed reason code plus a fixed, typed context block; nothing
 * in the library throws across its public API.
 *
 * @example
 * ```cpp
 * auto checked = manager->validate_path("docs/readme.md");
 * if (checked.isErr()) {
 *     std::cerr << checked.error().format() << "\n";
 * }
 * ```
 */

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pathguard {

// ============================================================================
// Reason Codes
// ============================================================================

enum class SecurityReason {
    // Path validation
    PATH_TRAVERSAL,
    UNSAFE_UNICODE,
    NORMALIZATION_ERROR,
    CASE_MISMATCH,

    // Symlink resolution
    SYMLINK_LOOP,
    SYMLINK_ERROR,
    SYMLINK_TARGET_NOT_ALLOWED,
    SYMLINK_MAX_DEPTH,
    SYMLINK_BROKEN,

    // Trust boundary
    PATH_NOT_IN_BASE,
    PATH_OUTSIDE_ALLOWED,
    TEMP_PATHS_NOT_ALLOWED,

    // Construction / configuration
    DIRECTORY_NOT_FOUND,
    CONFIG_ERROR,
    ALLOW_LIST_READ_ERROR,

    // Plain filesystem outcome, reported after all security gates passed
    FILE_NOT_FOUND,

    // Admission control and quotas
    RESOURCE_CONCURRENCY_LIMIT,
    RESOURCE_OPS_LIMIT,
    RESOURCE_TIME_LIMIT,

    BATCH_VALIDATION_FAILED,
};

// Canonical lowercase snake_case key, stable for JSON output
inline const char* reason_to_string(SecurityReason r) {
    switch (r) {
        case SecurityReason::PATH_TRAVERSAL: return "path_traversal";
        case SecurityReason::UNSAFE_UNICODE: return "unsafe_unicode";
        case SecurityReason::NORMALIZATION_ERROR: return "normalization_error";
        case SecurityReason::CASE_MISMATCH: return "case_mismatch";
        case SecurityReason::SYMLINK_LOOP: return "symlink_loop";
        case SecurityReason::SYMLINK_ERROR: return "symlink_error";
        case SecurityReason::SYMLINK_TARGET_NOT_ALLOWED: return "symlink_target_not_allowed";
        case SecurityReason::SYMLINK_MAX_DEPTH: return "symlink_max_depth";
        case SecurityReason::SYMLINK_BROKEN: return "symlink_broken";
        case SecurityReason::PATH_NOT_IN_BASE: return "path_not_in_base";
        case SecurityReason::PATH_OUTSIDE_ALLOWED: return "path_outside_allowed";
        case SecurityReason::TEMP_PATHS_NOT_ALLOWED: return "temp_paths_not_allowed";
        case SecurityReason::DIRECTORY_NOT_FOUND: return "directory_not_found";
        case SecurityReason::CONFIG_ERROR: return "config_error";
        case SecurityReason::ALLOW_LIST_READ_ERROR: return "allow_list_read_error";
        case SecurityReason::FILE_NOT_FOUND: return "file_not_found";
        case SecurityReason::RESOURCE_CONCURRENCY_LIMIT: return "resource_concurrency_limit";
        case SecurityReason::RESOURCE_OPS_LIMIT: return "resource_ops_limit";
        case SecurityReason::RESOURCE_TIME_LIMIT: return "resource_time_limit";
        case SecurityReason::BATCH_VALIDATION_FAILED: return "batch_validation_failed";
        default: return "unknown";
    }
}

// Parse a reason key (case-insensitive)
std::optional<SecurityReason> parse_reason(const std::string& key);

// ============================================================================
// Error Category
// ============================================================================

enum class ErrorCategory {
    Security,   // correctness violation, never retry unchanged
    Resource,   // quota / admission control, a batch may be retried
    NotFound,
    Config,
};

inline const char* category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Security: return "security";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::NotFound: return "not_found";
        case ErrorCategory::Config: return "config";
        default: return "security";
    }
}

ErrorCategory reason_category(SecurityReason r);

// ============================================================================
// Error Context
// ============================================================================

struct SecurityErrorContext {
    std::string path;                       // path as supplied by the caller
    std::string expanded_path;              // normalized / absolute form
    std::string base_dir;
    std::vector<std::string> allowed_dirs;
    std::vector<std::string> chain;         // symlink chain, in visit order
    std::string source;                     // symlink that failed
    std::string target;                     // its target
    std::string detail;                     // matched text, OS error, platform message
    int depth = -1;
    int max_depth = -1;
    bool windows_specific = false;
    std::vector<std::string> hints;
};

// ============================================================================
// SecurityError
// ============================================================================

class SecurityError {
public:
    SecurityError(SecurityReason reason, std::string message, SecurityErrorContext context = {})
        : reason_(reason), message_(std::move(message)), context_(std::move(context)) {}

    SecurityError& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    SecurityReason reason() const { return reason_; }
    const std::string& message() const { return message_; }
    const SecurityErrorContext& context() const { return context_; }
    SecurityErrorContext& context() { return context_; }

    ErrorCategory category() const { return reason_category(reason_); }
    bool is_security_error() const { return category() == ErrorCategory::Security; }
    bool is_resource_error() const { return category() == ErrorCategory::Resource; }

    // Multi-line, user-facing rendering: message, reason, path and, for
    // boundary violations, the configured base and allowed directories.
    std::string format() const;
    std::string toString() const { return format(); }

    nlohmann::json to_json() const;

private:
    SecurityReason reason_;
    std::string message_;
    SecurityErrorContext context_;
};

// Shorthand for the common "reason + message + offending path" case
inline SecurityError make_error(SecurityReason reason, std::string message,
                                const std::string& path = "") {
    SecurityErrorContext ctx;
    ctx.path = path;
    return SecurityError(reason, std::move(message), std::move(ctx));
}

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: SecurityError)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = SecurityError>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace pathguard
