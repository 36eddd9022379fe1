#include "devagent/rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace devagent {

namespace {

void validate_limits(double capacity, double refill_rate) {
    if (!(capacity > 0.0)) {
        throw std::invalid_argument("TokenBucket capacity must be > 0");
    }
    if (!(refill_rate > 0.0)) {
        throw std::invalid_argument("TokenBucket refill rate must be > 0");
    }
}

} // anonymous namespace

// ----------- TokenBucket -----------

TokenBucket::TokenBucket(double capacity, double refill_rate, Clock clock)
    : capacity_(capacity), refill_rate_(refill_rate), clock_(std::move(clock)) {
    validate_limits(capacity, refill_rate);
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    tokens_ = capacity_;
    last_refill_ = clock_();
}

void TokenBucket::refill_locked() {
    auto now = clock_();
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(capacity_, tokens_ + elapsed * refill_rate_);
    }
    last_refill_ = now;
}

bool TokenBucket::try_consume(double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    if (tokens_ >= tokens) {
        tokens_ = std::max(0.0, tokens_ - tokens);
        return true;
    }
    return false;
}

double TokenBucket::available_tokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    return tokens_;
}

int64_t TokenBucket::retry_after() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    if (tokens_ >= 1.0) return 0;
    return static_cast<int64_t>(std::ceil((1.0 - tokens_) / refill_rate_));
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = clock_();
}

// ----------- RateLimiter -----------

RateLimiter::RateLimiter(double default_capacity, double default_refill_rate,
                         std::map<std::string, RateLimitConfig> custom_limits,
                         TokenBucket::Clock clock)
    : default_capacity_(default_capacity),
      default_refill_rate_(default_refill_rate),
      clock_(std::move(clock)),
      custom_limits_(std::move(custom_limits)) {
    validate_limits(default_capacity_, default_refill_rate_);
    for (const auto& [key, config] : custom_limits_) {
        validate_limits(config.capacity, config.refill_rate);
    }
}

std::shared_ptr<TokenBucket> RateLimiter::bucket_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) return it->second;

    double capacity = default_capacity_;
    double refill_rate = default_refill_rate_;
    auto custom = custom_limits_.find(key);
    if (custom != custom_limits_.end()) {
        capacity = custom->second.capacity;
        refill_rate = custom->second.refill_rate;
    }
    auto bucket = std::make_shared<TokenBucket>(capacity, refill_rate, clock_);
    buckets_.emplace(key, bucket);
    return bucket;
}

RateLimitResult RateLimiter::check(const std::string& key) {
    auto bucket = bucket_for(key);

    RateLimitResult result;
    if (bucket->try_consume()) {
        result.allowed = true;
        result.remaining_tokens = bucket->available_tokens();
        return result;
    }
    result.allowed = false;
    result.remaining_tokens = 0.0;
    result.retry_after = bucket->retry_after();
    return result;
}

void RateLimiter::set_limit(const std::string& key, RateLimitConfig config) {
    validate_limits(config.capacity, config.refill_rate);
    std::lock_guard<std::mutex> lock(mutex_);
    custom_limits_[key] = config;
    buckets_.erase(key);
}

std::map<std::string, BucketStatus> RateLimiter::status() {
    std::vector<std::pair<std::string, std::shared_ptr<TokenBucket>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.assign(buckets_.begin(), buckets_.end());
    }
    std::map<std::string, BucketStatus> out;
    for (auto& [key, bucket] : snapshot) {
        out[key] = BucketStatus{bucket->available_tokens(), bucket->capacity()};
    }
    return out;
}

void RateLimiter::reset(const std::string& key) {
    std::shared_ptr<TokenBucket> bucket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buckets_.find(key);
        if (it == buckets_.end()) return;
        bucket = it->second;
    }
    bucket->reset();
}

void RateLimiter::reset_all() {
    std::vector<std::shared_ptr<TokenBucket>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, bucket] : buckets_) snapshot.push_back(bucket);
    }
    for (auto& bucket : snapshot) bucket->reset();
}

} // namespace devagent
