#pragma once

#include "pathguard/errors.hpp"

#include <string>

namespace pathguard {

class NormalizedPath;

/**
 * @brief Normalize a raw path string before any security decision.
 *
 * Steps:
 *   1. Reject invalid UTF-8 (NORMALIZATION_ERROR)
 *   2. NFKC normalization
 *   3. Scan for control and line-separator code points, confusable dots and
 *      ".." segments; the first match in string order decides the reason
 *      (PATH_TRAVERSAL for "..", UNSAFE_UNICODE otherwise)
 *   4. Backslashes to '/', repeated separators collapsed, "." segments and a
 *      trailing separator removed
 *   5. Made absolute against the current working directory
 *
 * The result is idempotent: normalize(normalize(p).str()) == normalize(p).
 */
Result<NormalizedPath> normalize(const std::string& path);

/**
 * Absolute, NFKC-normalized, forward-slash path.
 *
 * Never contains a ".." segment or an unsafe code point. Only normalize()
 * can create one.
 */
class NormalizedPath {
public:
    const std::string& str() const { return path_; }

    bool operator==(const NormalizedPath& other) const { return path_ == other.path_; }
    bool operator!=(const NormalizedPath& other) const { return path_ != other.path_; }
    bool operator<(const NormalizedPath& other) const { return path_ < other.path_; }

private:
    explicit NormalizedPath(std::string path) : path_(std::move(path)) {}

    friend Result<NormalizedPath> normalize(const std::string& path);

    std::string path_;
};

// Unicode case folding for comparisons on case-insensitive filesystems.
// Fails with CASE_MISMATCH if the string cannot be folded.
Result<std::string> fold_case(const std::string& path);

// True if the string contains a ".." segment (either separator style)
bool has_traversal_segment(const std::string& path);

// True if the string contains a control, line-separator or confusable-dot
// code point. Invalid UTF-8 counts as suspicious.
bool has_suspicious_unicode(const std::string& path);

} // namespace pathguard
