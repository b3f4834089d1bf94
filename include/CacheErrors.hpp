// include/CacheErrors.hpp
#pragma once
#include <stdexcept>
#include <string>

// Base for every error raised by kvstash.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed configuration (pragmas, directory, policy name, sizes).
class ValidationError : public CacheError {
public:
    explicit ValidationError(const std::string& msg) : CacheError(msg) {}
};

// incr/decr on an absent or expired key.
class NotFoundError : public CacheError {
public:
    explicit NotFoundError(const std::string& msg) : CacheError(msg) {}
};

// Non-numeric operand on incr/decr.
class TypeMismatchError : public CacheError {
public:
    explicit TypeMismatchError(const std::string& msg) : CacheError(msg) {}
};

// Write lock not acquired inside the allotted window.
class LockTimeoutError : public CacheError {
public:
    explicit LockTimeoutError(const std::string& msg) : CacheError(msg) {}
};

// SQLite or filesystem failure the engine did not expect.
class EngineError : public CacheError {
public:
    explicit EngineError(const std::string& msg) : CacheError(msg) {}
};
