#include "pathguard/depth_protector.hpp"

#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace pathguard {

// ============================================================================
// ResolutionRequest
// ============================================================================

ResolutionRequest::ResolutionRequest(SymlinkDepthProtector* protector, uint64_t id)
    : protector_(protector), id_(id), start_(std::chrono::steady_clock::now()) {}

ResolutionRequest::ResolutionRequest(ResolutionRequest&& other) noexcept
    : protector_(std::exchange(other.protector_, nullptr)),
      id_(other.id_),
      start_(other.start_),
      ops_(other.ops_) {}

ResolutionRequest& ResolutionRequest::operator=(ResolutionRequest&& other) noexcept {
    if (this != &other) {
        release();
        protector_ = std::exchange(other.protector_, nullptr);
        id_ = other.id_;
        start_ = other.start_;
        ops_ = other.ops_;
    }
    return *this;
}

ResolutionRequest::~ResolutionRequest() {
    release();
}

std::chrono::milliseconds ResolutionRequest::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
}

Result<void> ResolutionRequest::charge_op() {
    if (!protector_) {
        return Result<void>::ok();
    }

    ++ops_;
    protector_->record_op();

    const ProtectorLimits& limits = protector_->limits_;
    if (ops_ > limits.max_filesystem_ops) {
        protector_->record_limit_hit(SecurityReason::RESOURCE_OPS_LIMIT);
        SecurityErrorContext ctx;
        ctx.detail = std::to_string(ops_) + " operations";
        return Result<void>::err(SecurityError(SecurityReason::RESOURCE_OPS_LIMIT,
            "Filesystem operations limit exceeded (" +
                std::to_string(limits.max_filesystem_ops) + ")",
            std::move(ctx)));
    }

    auto spent = elapsed();
    if (spent > limits.max_processing_time) {
        protector_->record_limit_hit(SecurityReason::RESOURCE_TIME_LIMIT);
        SecurityErrorContext ctx;
        ctx.detail = std::to_string(spent.count()) + "ms elapsed";
        return Result<void>::err(SecurityError(SecurityReason::RESOURCE_TIME_LIMIT,
            "Symlink processing time exceeded " +
                std::to_string(limits.max_processing_time.count()) + "ms",
            std::move(ctx)));
    }

    return Result<void>::ok();
}

void ResolutionRequest::release() {
    if (!protector_) {
        return;
    }
    SymlinkDepthProtector* protector = protector_;
    protector_ = nullptr;

    // Hold the slot until the minimum response time has passed
    const ProtectorLimits& limits = protector->limits_;
    if (limits.timing_protection) {
        auto spent = std::chrono::steady_clock::now() - start_;
        if (spent < limits.min_response_time) {
            std::this_thread::sleep_for(limits.min_response_time - spent);
        }
    }

    protector->finish(id_);
}

// ============================================================================
// SymlinkDepthProtector
// ============================================================================

SymlinkDepthProtector::SymlinkDepthProtector(ProtectorLimits limits)
    : limits_(limits) {}

Result<ResolutionRequest> SymlinkDepthProtector::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (active_.size() >= static_cast<size_t>(limits_.max_concurrent_requests)) {
        metrics_.rejected_requests++;
        spdlog::warn("Symlink resolution rejected: {} of {} slots in use",
                     active_.size(), limits_.max_concurrent_requests);
        SecurityErrorContext ctx;
        ctx.detail = std::to_string(active_.size()) + "/" +
                     std::to_string(limits_.max_concurrent_requests);
        return Result<ResolutionRequest>::err(SecurityError(
            SecurityReason::RESOURCE_CONCURRENCY_LIMIT,
            "Too many concurrent requests (" + ctx.detail + ")",
            std::move(ctx)));
    }

    uint64_t id = ++next_id_;
    active_.insert(id);
    metrics_.total_requests++;
    return Result<ResolutionRequest>::ok(ResolutionRequest(this, id));
}

size_t SymlinkDepthProtector::active_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

ProtectorMetrics SymlinkDepthProtector::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProtectorMetrics snapshot = metrics_;
    snapshot.active_requests = active_.size();
    return snapshot;
}

void SymlinkDepthProtector::reset_metrics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = ProtectorMetrics();
}

void SymlinkDepthProtector::finish(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(id);
}

void SymlinkDepthProtector::record_op() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.filesystem_ops++;
}

void SymlinkDepthProtector::record_limit_hit(SecurityReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reason == SecurityReason::RESOURCE_OPS_LIMIT) {
        metrics_.ops_limit_hits++;
    } else if (reason == SecurityReason::RESOURCE_TIME_LIMIT) {
        metrics_.time_limit_hits++;
    }
}

} // namespace pathguard
