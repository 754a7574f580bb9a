#include "rate_limiter.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"

namespace Reader {
namespace Limiter {

using namespace Reader::Core;

RateLimiter::RateLimiter(const RateLimiterConfig& config) : config_(config) {
    config_.capacity    = std::max(config_.capacity, 1);
    config_.max_clients = std::max<size_t>(config_.max_clients, 1);
    if (config_.window.count() <= 0)
        config_.window = std::chrono::seconds(1);
}

Admission RateLimiter::admit(const std::string& client_id) {
    return admit(client_id, Clock::now());
}

Admission RateLimiter::admit(const std::string& client_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(client_id);
    if (it == buckets_.end() || it->second.reset_at <= now) {
        if (it == buckets_.end() && buckets_.size() >= config_.max_clients)
            make_room(now);
        buckets_[client_id] = Bucket{1, now + config_.window};
        return {};
    }

    Bucket& bucket = it->second;
    if (bucket.count < config_.capacity) {
        ++bucket.count;
        return {};
    }

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(bucket.reset_at - now).count();
    Admission denied;
    denied.allowed             = false;
    denied.retry_after_seconds = std::max<int>(1, static_cast<int>((remaining + 999) / 1000));
    return denied;
}

size_t RateLimiter::purge_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(buckets_, [now](const auto& entry) { return entry.second.reset_at <= now; });
}

size_t RateLimiter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

void RateLimiter::make_room(Clock::time_point now) {
    std::erase_if(buckets_, [now](const auto& entry) { return entry.second.reset_at <= now; });
    if (buckets_.size() < config_.max_clients)
        return;

    auto oldest = std::min_element(buckets_.begin(), buckets_.end(), [](const auto& a, const auto& b) {
        return a.second.reset_at < b.second.reset_at;
    });
    Logger::debug("RateLimiter: evicting client " + oldest->first);
    buckets_.erase(oldest);
}

}  // namespace Limiter
}  // namespace Reader
