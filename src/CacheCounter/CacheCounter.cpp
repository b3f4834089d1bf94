// === src/CacheCounter/CacheCounter.cpp ===
#include "CacheCounter.hpp"
#include <algorithm>

CacheCounter::CacheCounter(int64_t max_size)
    : max_size_(max_size),
      spin_limit_(std::max<int64_t>(max_size / 10, kMinSpinLimit)) {}

// Desc: account delta inserted rows and one write
// In: int64_t delta
// Out: bool (false once over max_size or after spin_limit writes)
bool CacheCounter::add(int64_t delta) {
    std::lock_guard<std::mutex> lk(mu_);
    count_ += delta;
    ++spin_;
    return count_ <= max_size_ && spin_ <= spin_limit_;
}

void CacheCounter::sub(int64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    count_ = std::max<int64_t>(count_ - n, 0);
    ++spin_;
}

void CacheCounter::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    count_ = 0;
    spin_ = 0;
}

// resync with an authoritative COUNT; starts a new spin window
void CacheCounter::align(int64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    count_ = n;
    spin_ = 0;
}

int64_t CacheCounter::count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return count_;
}

int64_t CacheCounter::spin_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return spin_;
}
