#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../core/types/constants.hpp"

namespace Reader {
namespace Limiter {

struct Admission {
    bool allowed             = true;
    int  retry_after_seconds = 0;  // > 0 only when denied
};

struct RateLimiterConfig {
    std::chrono::seconds window      = std::chrono::seconds(Core::Constants::DEFAULT_RATE_WINDOW_SECONDS);
    int                  capacity    = Core::Constants::DEFAULT_RATE_LIMIT;
    size_t               max_clients = Core::Constants::DEFAULT_RATE_MAX_CLIENTS;
};

// Fixed-window admission control keyed by client identifier. Windows do not
// slide: a bucket is replaced once its window has elapsed.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(const RateLimiterConfig& config = {});

    Admission admit(const std::string& client_id);
    Admission admit(const std::string& client_id, Clock::time_point now);

    // Drops every bucket whose window has elapsed. Returns the number removed.
    size_t purge_expired(Clock::time_point now);
    size_t size() const;

private:
    struct Bucket {
        int               count = 0;
        Clock::time_point reset_at;
    };

    void make_room(Clock::time_point now);

    RateLimiterConfig                       config_;
    std::unordered_map<std::string, Bucket> buckets_;
    mutable std::mutex                      mutex_;
};

}  // namespace Limiter
}  // namespace Reader
