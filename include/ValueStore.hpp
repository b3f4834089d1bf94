// include/ValueStore.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "Value.hpp"

// Serializes keys/values into (payload, format) pairs. Payloads at or above
// raw_max_size bytes go to content-addressed overflow files named by their
// MD5 hex digest, with a reference count kept in "<digest>.ref".
class ValueStore {
public:
    using Dumped = std::pair<Value, DataFormat>;

    ValueStore(std::string directory, size_t raw_max_size);

    // serialize; writes (or references) an overflow file when needed
    Dumped dump(const Value& v);
    // same mapping as dump() but never touches the filesystem
    Dumped signature(const Value& v) const;
    // empty when the overflow file behind a File* payload is gone
    std::optional<Value> load(const Value& payload, DataFormat fmt) const;

    std::string write(const std::string& data);
    std::optional<std::string> read(const std::string& sig) const;
    // drop one reference; the file goes away with the last one
    bool release(const std::string& sig);
    // reference count recorded for sig (0 when unknown)
    int64_t references(const std::string& sig) const;

    static std::string md5_hex(const std::string& data);

    const std::string& directory() const { return directory_; }
    size_t raw_max_size() const { return raw_max_size_; }

private:
    // spill receives the bytes to store in an overflow file, if any
    Dumped encode(const Value& v, std::optional<std::string>& spill) const;

    std::string content_path(const std::string& sig) const;
    std::string ref_path(const std::string& sig) const;

    std::string directory_;
    size_t raw_max_size_;
};
