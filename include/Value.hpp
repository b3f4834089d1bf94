// include/Value.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using Bytes = std::vector<unsigned char>;

// Storage format tag persisted in key_format / value_format.
enum class DataFormat : int {
    Raw        = 0,
    Number     = 1,
    FileString = 2,
    FileBytes  = 3,
    Pickle     = 4,
    FilePickle = 5,
};

const char* format_name(DataFormat fmt);
bool is_file_format(DataFormat fmt);

// Key or value handled by the cache. Objects are JSON documents and go
// through the CBOR codec when stored.
class Value {
public:
    enum class Type { None, Integer, Real, String, Bytes, Object };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(int v) : data_(std::in_place_index<1>, v) {}
    Value(long v) : data_(std::in_place_index<1>, v) {}
    Value(long long v) : data_(std::in_place_index<1>, v) {}
    Value(double v) : data_(std::in_place_index<2>, v) {}
    Value(const char* s) : data_(std::in_place_index<3>, s) {}
    Value(std::string s) : data_(std::in_place_index<3>, std::move(s)) {}
    Value(Bytes b) : data_(std::in_place_index<4>, std::move(b)) {}
    Value(nlohmann::json j) : data_(std::in_place_index<5>, std::move(j)) {}

    Type type() const { return static_cast<Type>(data_.index()); }
    bool is_none() const { return type() == Type::None; }
    bool is_number() const { return type() == Type::Integer || type() == Type::Real; }

    int64_t as_int() const;
    double as_real() const;
    const std::string& as_string() const;
    const Bytes& as_bytes() const;
    const nlohmann::json& as_object() const;

    // Human readable rendering for logs and the CLI.
    std::string to_string() const;

    bool operator==(const Value& o) const { return data_ == o.data_; }
    bool operator!=(const Value& o) const { return data_ != o.data_; }
    bool operator<(const Value& o) const { return data_ < o.data_; }

private:
    std::variant<std::monostate, int64_t, double, std::string, Bytes, nlohmann::json> data_;
};
