#include "service/admission.hpp"
#include <cmath>
#include <stdexcept>

namespace chromadex {

namespace {

constexpr size_t PURGE_INTERVAL = 1024;

}

MemoryCounterStore::MemoryCounterStore()
    : MemoryCounterStore([]() { return std::chrono::steady_clock::now(); }) {}

MemoryCounterStore::MemoryCounterStore(Clock clock) : clock_(std::move(clock)) {}

void MemoryCounterStore::purge_expired(TimePoint now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

CounterStore::Counter MemoryCounterStore::increment(const std::string& key, int ttl_sec) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();

    if (++since_purge_ >= PURGE_INTERVAL) {
        purge_expired(now);
        since_purge_ = 0;
    }

    Entry& entry = entries_[key];
    if (entry.value == 0 || entry.expires <= now) {
        entry.value = 0;
        entry.expires = now + std::chrono::seconds(ttl_sec);
    }
    ++entry.value;

    Counter counter;
    counter.value = entry.value;
    counter.ttl_remaining_sec = std::chrono::duration<double>(entry.expires - now).count();
    return counter;
}

size_t MemoryCounterStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string RateLimiter::key(const std::string& client, const std::string& action, int window_sec) {
    return client + ":" + action + ":" + std::to_string(window_sec);
}

Result RateLimiter::check(const std::string& client, const std::string& action, const Rule& rule) {
    if (client.empty()) return Result::ok();

    CounterStore::Counter counter = store_.increment(key(client, action, rule.window_sec), rule.window_sec);
    if (counter.value <= rule.limit) return Result::ok();

    int retry_after = static_cast<int>(std::ceil(counter.ttl_remaining_sec));
    if (retry_after < 1) retry_after = 1;

    Result result = Result::fail(ErrorCode::RATE_LIMIT_EXCEEDED,
                                 "Rate limit exceeded. Try again in " + std::to_string(retry_after) +
                                     " seconds.");
    result.retry_after = retry_after;
    return result;
}

ConcurrencyGate::ConcurrencyGate(int capacity) : capacity_(capacity) {
    if (capacity < 1) {
        throw std::invalid_argument("concurrency gate capacity must be at least 1");
    }
}

ConcurrencyGate::Permit ConcurrencyGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) return Permit();
    ++in_use_;
    return Permit(this);
}

int ConcurrencyGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void ConcurrencyGate::release_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0) --in_use_;
}

void ConcurrencyGate::Permit::release() {
    if (gate_) {
        gate_->release_one();
        gate_ = nullptr;
    }
}

}
