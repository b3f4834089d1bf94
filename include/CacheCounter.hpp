// include/CacheCounter.hpp
#pragma once
#include <cstdint>
#include <mutex>

// Approximate live-row count of one namespace. The mutex protects the two
// counters only, never the store.
class CacheCounter {
public:
    static constexpr int64_t kMinSpinLimit = 1024;

    explicit CacheCounter(int64_t max_size);

    // false means "run the eviction sweep now"
    bool add(int64_t delta);
    void sub(int64_t n);
    void reset();
    void align(int64_t n);

    int64_t count() const;
    int64_t spin_count() const;
    int64_t max_size() const { return max_size_; }
    int64_t spin_limit() const { return spin_limit_; }

private:
    mutable std::mutex mu_;
    int64_t max_size_;
    int64_t spin_limit_;
    int64_t count_ = 0;
    int64_t spin_ = 0;
};
