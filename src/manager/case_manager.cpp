#include "pathguard/case_manager.hpp"

namespace pathguard {

void CaseManager::set_original_case(const std::string& normalized, const std::string& original) {
    std::lock_guard<std::mutex> lock(mutex_);
    mapping_[normalized] = original;
}

std::string CaseManager::get_original_case(const std::string& normalized) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mapping_.find(normalized);
    if (it == mapping_.end()) {
        return normalized;
    }
    return it->second;
}

void CaseManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    mapping_.clear();
}

size_t CaseManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mapping_.size();
}

} // namespace pathguard
