#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace devagent {

struct RateLimitConfig {
    double capacity;     // burst size
    double refill_rate;  // tokens per second
};

struct RateLimitResult {
    bool allowed = false;
    double remaining_tokens = 0.0;
    int64_t retry_after = 0;  // whole seconds, rounded up
};

struct BucketStatus {
    double available = 0.0;
    double capacity = 0.0;

    bool operator==(const BucketStatus& o) const {
        return available == o.available && capacity == o.capacity;
    }
};

/// Token bucket: bursts up to `capacity`, refills continuously at
/// `refill_rate` tokens per second. Refill happens lazily before every
/// read or consume. Thread-safe.
class TokenBucket {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /// Throws std::invalid_argument unless capacity > 0 and refill_rate > 0.
    /// An empty clock means std::chrono::steady_clock::now.
    TokenBucket(double capacity, double refill_rate, Clock clock = nullptr);

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    bool try_consume(double tokens = 1.0);
    [[nodiscard]] double available_tokens();
    [[nodiscard]] int64_t retry_after();
    void reset();

    double capacity() const { return capacity_; }
    double refill_rate() const { return refill_rate_; }

private:
    void refill_locked();

    const double capacity_;
    const double refill_rate_;
    Clock clock_;

    std::mutex mutex_;
    double tokens_;
    TimePoint last_refill_;
};

/// One TokenBucket per key (tool name), created on first use.
class RateLimiter {
public:
    explicit RateLimiter(double default_capacity = 100.0,
                         double default_refill_rate = 10.0,
                         std::map<std::string, RateLimitConfig> custom_limits = {},
                         TokenBucket::Clock clock = nullptr);

    /// Consume one token for `key`.
    RateLimitResult check(const std::string& key);

    /// Override the limit for `key`. The key's bucket is recreated full.
    void set_limit(const std::string& key, RateLimitConfig config);

    [[nodiscard]] std::map<std::string, BucketStatus> status();

    void reset(const std::string& key);
    void reset_all();

private:
    std::shared_ptr<TokenBucket> bucket_for(const std::string& key);

    const double default_capacity_;
    const double default_refill_rate_;
    TokenBucket::Clock clock_;

    std::mutex mutex_;
    std::map<std::string, RateLimitConfig> custom_limits_;
    std::unordered_map<std::string, std::shared_ptr<TokenBucket>> buckets_;
};

} // namespace devagent
