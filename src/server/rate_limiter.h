#pragma once

#include "src/server/config.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace zxcompile {

struct AdmissionDecision {
    bool allowed = true;
    std::string reason;
    std::chrono::seconds retry_after{0};
};

// Per-client admission gate. Each client keeps the timestamps of its recent
// requests (oldest first) covering the hour window, and an optional lockout.
// A client that trips a threshold is locked out and denied without counting
// until the lockout expires.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kMinuteWindow{60};
    static constexpr std::chrono::seconds kHourWindow{3600};

    explicit RateLimiter(const RateLimitConfig& config, NowFunction now = nullptr);

    AdmissionDecision Admit(const std::string& client_id);

    // Drops clients with no request inside the hour window and no active lockout.
    // Returns how many were dropped.
    size_t EvictIdle();

    size_t ClientCount() const;

private:
    struct ClientWindow {
        std::deque<Clock::time_point> recent_requests;
        std::optional<Clock::time_point> blocked_until;
    };

    size_t EvictIdleLocked(Clock::time_point now);

    RateLimitConfig config_;
    NowFunction now_;
    std::chrono::seconds eviction_interval_;
    Clock::time_point last_eviction_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ClientWindow> clients_;
};

} // namespace zxcompile
