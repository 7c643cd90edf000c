#include "src/server/rate_limiter.h"
#include "src/server/logger.h"

#include <algorithm>
#include <utility>

namespace zxcompile {

namespace {

std::chrono::seconds CeilSeconds(RateLimiter::Clock::duration duration) {
    return std::chrono::ceil<std::chrono::seconds>(duration);
}

} // namespace

RateLimiter::RateLimiter(const RateLimitConfig& config, NowFunction now)
    : config_(config),
      now_(now ? std::move(now) : NowFunction([]() { return Clock::now(); })),
      eviction_interval_(kHourWindow) {
    last_eviction_ = now_();
}

AdmissionDecision RateLimiter::Admit(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Clock::time_point now = now_();

    if (now - last_eviction_ >= eviction_interval_) {
        size_t evicted = EvictIdleLocked(now);
        if (evicted > 0) Logger::Debug("Evicted ", evicted, " idle rate-limit entries");
        last_eviction_ = now;
    }

    ClientWindow& window = clients_[client_id];

    if (window.blocked_until) {
        if (*window.blocked_until > now) {
            auto remaining = CeilSeconds(*window.blocked_until - now);
            return {false,
                    "Rate limit exceeded. Try again in " + std::to_string(remaining.count()) + " seconds.",
                    remaining};
        }
        window.blocked_until.reset();
    }

    auto& requests = window.recent_requests;
    while (!requests.empty() && now - requests.front() > kHourWindow) {
        requests.pop_front();
    }

    // Both counts include the request being decided.
    const Clock::time_point minute_start = now - kMinuteWindow;
    auto in_last_minute = 1 + static_cast<int>(std::count_if(
        requests.begin(), requests.end(),
        [minute_start](Clock::time_point t) { return t > minute_start; }));

    if (in_last_minute >= config_.per_minute) {
        window.blocked_until = now + config_.minute_lockout;
        Logger::Warn("Client ", client_id, " reached ", config_.per_minute,
                     " requests/minute; blocked for ", config_.minute_lockout.count(), "s");
        return {false,
                "Rate limit exceeded: too many requests in the last minute. Try again in " +
                    std::to_string(config_.minute_lockout.count()) + " seconds.",
                config_.minute_lockout};
    }

    if (static_cast<int>(requests.size()) + 1 >= config_.per_hour) {
        window.blocked_until = now + config_.hour_lockout;
        Logger::Warn("Client ", client_id, " reached ", config_.per_hour,
                     " requests/hour; blocked for ", config_.hour_lockout.count(), "s");
        return {false,
                "Rate limit exceeded: too many requests in the last hour. Try again in " +
                    std::to_string(config_.hour_lockout.count()) + " seconds.",
                config_.hour_lockout};
    }

    requests.push_back(now);
    return {};
}

size_t RateLimiter::EvictIdle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return EvictIdleLocked(now_());
}

size_t RateLimiter::EvictIdleLocked(Clock::time_point now) {
    size_t evicted = 0;
    for (auto it = clients_.begin(); it != clients_.end();) {
        const ClientWindow& window = it->second;
        bool blocked = window.blocked_until && *window.blocked_until > now;
        bool recent = !window.recent_requests.empty() &&
                      now - window.recent_requests.back() <= kHourWindow;
        if (!blocked && !recent) {
            it = clients_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t RateLimiter::ClientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

} // namespace zxcompile
