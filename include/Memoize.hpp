// include/Memoize.hpp
#pragma once
#include <utility>

#include "CacheEngine.hpp"

// Wrap fn so its result is kept in cache under key for timeout seconds.
// Works with anything exposing get(key) -> optional<Value> and
// set(key, value, timeout), i.e. CacheEngine and NamespaceRouter. The
// arguments are not part of the key.
template <class Cache, class Fn>
auto memoize(Cache& cache, Value key, Timeout timeout, Fn fn) {
    return [&cache, key = std::move(key), timeout, fn = std::move(fn)](auto&&... args) -> Value {
        if (auto hit = cache.get(key)) return std::move(*hit);
        Value v = fn(std::forward<decltype(args)>(args)...);
        cache.set(key, v, timeout);
        return v;
    };
}
