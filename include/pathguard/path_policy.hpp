#pragma once

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Platform Path Policy
// ============================================================================

/**
 * @brief Platform-specific path rules, chosen once and injected.
 *
 * The joiner, the symlink resolver and the SecurityManager take a policy
 * reference instead of branching on the host OS. host_path_policy() picks the
 * policy for the running platform; tests pass windows_path_policy() directly
 * to exercise Windows rules on any host.
 */
class PathPolicy {
public:
    virtual ~PathPolicy() = default;

    virtual const char* name() const = 0;
    virtual bool is_windows() const = 0;

    // Filesystem compares names case-insensitively (macOS, Windows)
    virtual bool is_case_insensitive() const = 0;

    // Platform hazard in a path (symlink targets, user input), or nullopt
    virtual std::optional<std::string> validate(const std::string& path) const = 0;

    // safe_join hooks; false means reject the join
    virtual bool check_join_base(const std::string& base) const = 0;
    virtual bool check_join_component(const std::string& segment) const = 0;
    virtual bool check_join_result(const std::string& joined) const = 0;
};

class PosixPathPolicy : public PathPolicy {
public:
    explicit PosixPathPolicy(bool case_insensitive = false)
        : case_insensitive_(case_insensitive) {}

    const char* name() const override { return "posix"; }
    bool is_windows() const override { return false; }
    bool is_case_insensitive() const override { return case_insensitive_; }

    std::optional<std::string> validate(const std::string& path) const override;
    bool check_join_base(const std::string& base) const override;
    bool check_join_component(const std::string& segment) const override;
    bool check_join_result(const std::string& joined) const override;

private:
    bool case_insensitive_;
};

class WindowsPathPolicy : public PathPolicy {
public:
    const char* name() const override { return "windows"; }
    bool is_windows() const override { return true; }
    bool is_case_insensitive() const override { return true; }

    std::optional<std::string> validate(const std::string& path) const override;
    bool check_join_base(const std::string& base) const override;
    bool check_join_component(const std::string& segment) const override;
    bool check_join_result(const std::string& joined) const override;
};

// Policy for the running platform (macOS gets a case-insensitive POSIX policy)
const PathPolicy& host_path_policy();

const PathPolicy& posix_path_policy();
const PathPolicy& windows_path_policy();

} // namespace pathguard
