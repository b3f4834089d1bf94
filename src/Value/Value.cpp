// === src/Value/Value.cpp ===
#include "Value.hpp"
#include "CacheErrors.hpp"

#include <sstream>
#include <iomanip>


const char* format_name(DataFormat fmt) {
    switch (fmt) {
        case DataFormat::Raw:        return "raw";
        case DataFormat::Number:     return "number";
        case DataFormat::FileString: return "string-file";
        case DataFormat::FileBytes:  return "bytes-file";
        case DataFormat::Pickle:     return "pickle";
        case DataFormat::FilePickle: return "pickle-file";
    }
    return "unknown";
}

bool is_file_format(DataFormat fmt) {
    return fmt == DataFormat::FileString ||
           fmt == DataFormat::FileBytes  ||
           fmt == DataFormat::FilePickle;
}


// Desc: integer view of a numeric value (reals are truncated)
// In: (none)
// Out: int64_t; throws TypeMismatchError for non-numbers
int64_t Value::as_int() const {
    if (type() == Type::Integer) return std::get<1>(data_);
    if (type() == Type::Real)    return static_cast<int64_t>(std::get<2>(data_));
    throw TypeMismatchError("value is not a number");
}

double Value::as_real() const {
    if (type() == Type::Real)    return std::get<2>(data_);
    if (type() == Type::Integer) return static_cast<double>(std::get<1>(data_));
    throw TypeMismatchError("value is not a number");
}

const std::string& Value::as_string() const {
    if (type() != Type::String) throw TypeMismatchError("value is not a string");
    return std::get<3>(data_);
}

const Bytes& Value::as_bytes() const {
    if (type() != Type::Bytes) throw TypeMismatchError("value is not a byte string");
    return std::get<4>(data_);
}

const nlohmann::json& Value::as_object() const {
    if (type() != Type::Object) throw TypeMismatchError("value is not an object");
    return std::get<5>(data_);
}


// Desc: render value for logs / CLI output
// In: (none)
// Out: std::string
std::string Value::to_string() const {
    switch (type()) {
        case Type::None:    return "None";
        case Type::Integer: return std::to_string(std::get<1>(data_));
        case Type::Real: {
            std::ostringstream os;
            os << std::setprecision(17) << std::get<2>(data_);
            return os.str();
        }
        case Type::String:  return std::get<3>(data_);
        case Type::Bytes: {
            static const char* hex = "0123456789abcdef";
            const Bytes& b = std::get<4>(data_);
            std::string out = "b'";
            for (unsigned char c : b) {
                if (c >= 0x20 && c < 0x7f && c != '\'' && c != '\\') {
                    out.push_back(static_cast<char>(c));
                } else {
                    out += "\\x";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                }
            }
            out.push_back('\'');
            return out;
        }
        case Type::Object:  return std::get<5>(data_).dump();
    }
    return "";
}
