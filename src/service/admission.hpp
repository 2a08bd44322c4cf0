#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chromadex {

// Shared counters with expiry. increment() must be atomic per key.
class CounterStore {
public:
    struct Counter {
        int64_t value = 0;
        double ttl_remaining_sec = 0.0;
    };

    virtual ~CounterStore() = default;

    // Increments key. The first increment of a fresh or expired key sets its
    // expiry to ttl_sec from now; later increments leave the expiry alone.
    virtual Counter increment(const std::string& key, int ttl_sec) = 0;
};

class MemoryCounterStore : public CounterStore {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    MemoryCounterStore();
    explicit MemoryCounterStore(Clock clock);

    Counter increment(const std::string& key, int ttl_sec) override;
    size_t size() const;

private:
    struct Entry {
        int64_t value = 0;
        TimePoint expires;
    };

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    size_t since_purge_ = 0;

    void purge_expired(TimePoint now);
};

// Fixed-window limiter keyed by client, action and window size.
class RateLimiter {
public:
    struct Rule {
        int window_sec = 60;
        int limit = 15;
    };

    explicit RateLimiter(CounterStore& store) : store_(store) {}

    // Requests without a client id are never limited.
    Result check(const std::string& client, const std::string& action, const Rule& rule);

    static std::string key(const std::string& client, const std::string& action, int window_sec);

private:
    CounterStore& store_;
};

// Admission semaphore that rejects instead of queueing.
class ConcurrencyGate {
public:
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return gate_ != nullptr; }
        void release();

    private:
        friend class ConcurrencyGate;
        explicit Permit(ConcurrencyGate* gate) : gate_(gate) {}
        ConcurrencyGate* gate_ = nullptr;
    };

    explicit ConcurrencyGate(int capacity);

    // Empty permit when all slots are taken.
    Permit try_acquire();

    int capacity() const { return capacity_; }
    int in_use() const;

private:
    int capacity_;
    int in_use_ = 0;
    mutable std::mutex mutex_;

    void release_one();
};

}
