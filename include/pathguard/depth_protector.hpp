#pragma once

#include "pathguard/errors.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>

namespace pathguard {

// ============================================================================
// Limits and Metrics
// ============================================================================

struct ProtectorLimits {
    int max_concurrent_requests = 10;
    int max_filesystem_ops = 1000;
    std::chrono::milliseconds max_processing_time{5000};
    std::chrono::milliseconds min_response_time{100};
    bool timing_protection = true;
};

struct ProtectorMetrics {
    uint64_t total_requests = 0;
    uint64_t rejected_requests = 0;
    uint64_t filesystem_ops = 0;
    uint64_t ops_limit_hits = 0;
    uint64_t time_limit_hits = 0;
    size_t active_requests = 0;
};

class SymlinkDepthProtector;

// ============================================================================
// ResolutionRequest
// ============================================================================

/**
 * @brief One admitted resolution: a concurrency slot, a start time and an
 * operation counter.
 *
 * Move-only. The slot is returned when the request is released or
 * destroyed, whichever comes first. Release first sleeps out the remainder
 * of the minimum response time so that accepted and rejected paths take the
 * same time.
 */
class ResolutionRequest {
public:
    ResolutionRequest(ResolutionRequest&& other) noexcept;
    ResolutionRequest& operator=(ResolutionRequest&& other) noexcept;
    ResolutionRequest(const ResolutionRequest&) = delete;
    ResolutionRequest& operator=(const ResolutionRequest&) = delete;
    ~ResolutionRequest();

    // Count one filesystem operation (lstat, readlink, exists, ...).
    // Fails with RESOURCE_OPS_LIMIT or RESOURCE_TIME_LIMIT once a budget is spent.
    Result<void> charge_op();

    uint64_t id() const { return id_; }
    int filesystem_ops() const { return ops_; }
    std::chrono::milliseconds elapsed() const;
    bool active() const { return protector_ != nullptr; }

    void release();

private:
    friend class SymlinkDepthProtector;
    ResolutionRequest(SymlinkDepthProtector* protector, uint64_t id);

    SymlinkDepthProtector* protector_;
    uint64_t id_;
    std::chrono::steady_clock::time_point start_;
    int ops_ = 0;
};

// ============================================================================
// SymlinkDepthProtector
// ============================================================================

/**
 * @brief Admission control and budgets for symlink resolution.
 *
 * At most max_concurrent_requests resolutions are in flight at once; further
 * acquire() calls fail immediately with RESOURCE_CONCURRENCY_LIMIT. Nothing is
 * queued. Owned by a SecurityManager; must outlive every request it issues.
 */
class SymlinkDepthProtector {
public:
    explicit SymlinkDepthProtector(ProtectorLimits limits = ProtectorLimits());

    SymlinkDepthProtector(const SymlinkDepthProtector&) = delete;
    SymlinkDepthProtector& operator=(const SymlinkDepthProtector&) = delete;

    Result<ResolutionRequest> acquire();

    const ProtectorLimits& limits() const { return limits_; }
    size_t active_requests() const;

    ProtectorMetrics metrics() const;
    void reset_metrics();

private:
    friend class ResolutionRequest;

    void finish(uint64_t id);
    void record_op();
    void record_limit_hit(SecurityReason reason);

    ProtectorLimits limits_;
    mutable std::mutex mutex_;
    std::set<uint64_t> active_;
    uint64_t next_id_ = 0;
    ProtectorMetrics metrics_;
};

} // namespace pathguard
