// include/LazyCache.hpp
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

// Holds a T that is built by factory on first access, once, even when
// several threads race for it.
template <class T>
class LazyCache {
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    explicit LazyCache(Factory factory) : factory_(std::move(factory)) {}

    LazyCache(const LazyCache&) = delete;
    LazyCache& operator=(const LazyCache&) = delete;

    bool initialized() const { return ready_.load(std::memory_order_acquire); }

    T& get() {
        std::call_once(once_, [this] {
            obj_ = factory_();
            ready_.store(true, std::memory_order_release);
        });
        return *obj_;
    }

    T& operator*()  { return get(); }
    T* operator->() { return &get(); }

private:
    Factory factory_;
    std::once_flag once_;
    std::unique_ptr<T> obj_;
    std::atomic<bool> ready_{false};
};
