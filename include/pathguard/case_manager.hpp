#pragma once

#include <map>
#include <mutex>
#include <string>

namespace pathguard {

/**
 * Remembers the caller's original spelling of paths that were compared in
 * case-folded form. Owned by one SecurityManager; safe to use from several
 * threads.
 */
class CaseManager {
public:
    void set_original_case(const std::string& normalized, const std::string& original);

    // Original spelling, or `normalized` itself if none was recorded
    std::string get_original_case(const std::string& normalized) const;

    void clear();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> mapping_;
};

} // namespace pathguard
