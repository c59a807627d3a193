#include <doctest/doctest.h>
#include <pathguard/depth_protector.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace pathguard;
using namespace std::chrono_literals;

namespace {

ProtectorLimits fast_limits() {
    ProtectorLimits limits;
    limits.min_response_time = 0ms;
    return limits;
}

} // namespace

// ============================================================================
// Admission
// ============================================================================

TEST_CASE("acquire and release track active requests") {
    SymlinkDepthProtector protector(fast_limits());
    {
        auto request = protector.acquire();
        REQUIRE(request.isOk());
        CHECK(request.value().active());
        CHECK(protector.active_requests() == 1);
    }
    CHECK(protector.active_requests() == 0);
    CHECK(protector.metrics().total_requests == 1);
}

TEST_CASE("requests beyond the ceiling are rejected, not queued") {
    ProtectorLimits limits = fast_limits();
    limits.max_concurrent_requests = 2;
    SymlinkDepthProtector protector(limits);

    auto a = protector.acquire();
    auto b = protector.acquire();
    REQUIRE(a.isOk());
    REQUIRE(b.isOk());

    auto c = protector.acquire();
    REQUIRE(c.isErr());
    CHECK(c.error().reason() == SecurityReason::RESOURCE_CONCURRENCY_LIMIT);
    CHECK(c.error().is_resource_error());
    CHECK(c.error().message() == "Too many concurrent requests (2/2)");
    CHECK(protector.metrics().rejected_requests == 1);

    a.value().release();
    CHECK(protector.acquire().isOk());
}

TEST_CASE("concurrency limit plus one simultaneous resolutions yields one rejection") {
    ProtectorLimits limits;
    limits.max_concurrent_requests = 10;
    limits.min_response_time = 1000ms;
    SymlinkDepthProtector protector(limits);

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < limits.max_concurrent_requests + 1; ++i) {
        threads.emplace_back([&]() {
            auto request = protector.acquire();
            if (request.isOk()) {
                accepted++;
            } else if (request.error().reason() == SecurityReason::RESOURCE_CONCURRENCY_LIMIT) {
                rejected++;
            }
            // The slot is held until the minimum response time has passed
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(accepted.load() == 10);
    CHECK(rejected.load() == 1);
    CHECK(protector.active_requests() == 0);
}

// ============================================================================
// Budgets
// ============================================================================

TEST_CASE("filesystem operation budget") {
    ProtectorLimits limits = fast_limits();
    limits.max_filesystem_ops = 3;
    SymlinkDepthProtector protector(limits);

    auto request = protector.acquire();
    REQUIRE(request.isOk());
    CHECK(request.value().charge_op().isOk());
    CHECK(request.value().charge_op().isOk());
    CHECK(request.value().charge_op().isOk());

    auto over = request.value().charge_op();
    REQUIRE(over.isErr());
    CHECK(over.error().reason() == SecurityReason::RESOURCE_OPS_LIMIT);
    CHECK(request.value().filesystem_ops() == 4);

    auto m = protector.metrics();
    CHECK(m.filesystem_ops == 4);
    CHECK(m.ops_limit_hits == 1);
}

TEST_CASE("processing time budget") {
    ProtectorLimits limits = fast_limits();
    limits.max_processing_time = 10ms;
    SymlinkDepthProtector protector(limits);

    auto request = protector.acquire();
    REQUIRE(request.isOk());
    std::this_thread::sleep_for(30ms);

    auto late = request.value().charge_op();
    REQUIRE(late.isErr());
    CHECK(late.error().reason() == SecurityReason::RESOURCE_TIME_LIMIT);
    CHECK(protector.metrics().time_limit_hits == 1);
}

TEST_CASE("reset_metrics clears counters") {
    SymlinkDepthProtector protector(fast_limits());
    {
        auto request = protector.acquire();
        REQUIRE(request.isOk());
        CHECK(request.value().charge_op().isOk());
    }
    protector.reset_metrics();
    auto m = protector.metrics();
    CHECK(m.total_requests == 0);
    CHECK(m.filesystem_ops == 0);
}

// ============================================================================
// Timing protection
// ============================================================================

TEST_CASE("release waits out the minimum response time") {
    ProtectorLimits limits;
    limits.min_response_time = 50ms;
    SymlinkDepthProtector protector(limits);

    auto start = std::chrono::steady_clock::now();
    {
        auto request = protector.acquire();
        REQUIRE(request.isOk());
    }
    CHECK(std::chrono::steady_clock::now() - start >= 50ms);
}

TEST_CASE("timing protection can be disabled") {
    ProtectorLimits limits;
    limits.min_response_time = 2000ms;
    limits.timing_protection = false;
    SymlinkDepthProtector protector(limits);

    auto start = std::chrono::steady_clock::now();
    {
        auto request = protector.acquire();
        REQUIRE(request.isOk());
    }
    CHECK(std::chrono::steady_clock::now() - start < 1000ms);
}

TEST_CASE("moved-from requests no longer hold a slot") {
    SymlinkDepthProtector protector(fast_limits());
    auto request = protector.acquire();
    REQUIRE(request.isOk());

    ResolutionRequest moved = std::move(request.value());
    CHECK(moved.active());
    CHECK_FALSE(request.value().active());
    CHECK(protector.active_requests() == 1);

    moved.release();
    CHECK(protector.active_requests() == 0);
}
