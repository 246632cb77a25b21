// JSON parsing and serialization utilities
#pragma once

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/random.hpp"

namespace stablesim {

// ============================================================================
// Output formatting (value -> JSON)
// ============================================================================

// Non-finite values serialize as null (JSON has no NaN/Inf)
template <typename T>
inline boost::json::value to_json_real(T v) {
    const double d = static_cast<double>(v);
    if (!std::isfinite(d)) return nullptr;
    return d;
}

template <typename T>
inline boost::json::array to_json_array(const std::vector<T>& xs, size_t stride = 1) {
    boost::json::array a;
    if (stride == 0) stride = 1;
    a.reserve(xs.size() / stride + 1);
    for (size_t i = 0; i < xs.size(); i += stride) {
        a.push_back(to_json_real(xs[i]));
    }
    return a;
}

// ============================================================================
// JSON value parsing (boost::json::value -> T)
// ============================================================================

// Parse a JSON value as a plain real number (numbers or numeric strings)
template <typename T>
inline T parse_plain_real(const boost::json::value& v, const char* key = "value") {
    if (v.is_double()) return static_cast<T>(v.as_double());
    if (v.is_int64())  return static_cast<T>(v.as_int64());
    if (v.is_uint64()) return static_cast<T>(v.as_uint64());
    if (v.is_string()) {
        const char* s = v.as_string().c_str();
        char* end = nullptr;
        const long double x = std::strtold(s, &end);
        if (end != s) return static_cast<T>(x);
    }
    throw InvalidConfiguration(std::string("expected a number for key: ") + key);
}

// [lo, hi] pair
template <typename T>
inline Range<T> parse_range(const boost::json::value& v, const char* key) {
    if (!v.is_array() || v.as_array().size() != 2) {
        throw InvalidConfiguration(std::string("expected [lo, hi] for key: ") + key);
    }
    const auto& a = v.as_array();
    return Range<T>{parse_plain_real<T>(a[0], key), parse_plain_real<T>(a[1], key)};
}

// ============================================================================
// JSON object accessors
// ============================================================================

// Get a required string value from a JSON object (throws on missing/wrong type)
inline std::string get_str(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw InvalidConfiguration(std::string("missing key: ") + key);
    }
    if (!it->value().is_string()) {
        throw InvalidConfiguration(std::string("expected string for key: ") + key);
    }
    return std::string(it->value().as_string().c_str());
}

inline std::string get_str_opt(const boost::json::object& obj, const char* key, const std::string& default_value) {
    return obj.contains(key) ? get_str(obj, key) : default_value;
}

// Get an optional uint64 value from a JSON object (returns default if missing)
inline uint64_t get_u64_opt(const boost::json::object& obj, const char* key, uint64_t default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    const auto& v = it->value();
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64() && v.as_int64() >= 0) return static_cast<uint64_t>(v.as_int64());
    if (v.is_double() && v.as_double() >= 0.0 && std::floor(v.as_double()) == v.as_double()) {
        return static_cast<uint64_t>(v.as_double());
    }
    if (v.is_string()) {
        const char* s = v.as_string().c_str();
        char* end = nullptr;
        const unsigned long long x = std::strtoull(s, &end, 10);
        if (end != s && *end == '\0') return static_cast<uint64_t>(x);
    }
    throw InvalidConfiguration(std::string("expected a non-negative integer for key: ") + key);
}

template <typename T>
inline T get_real_opt(const boost::json::object& obj, const char* key, T default_value) {
    if (auto* v = obj.if_contains(key)) return parse_plain_real<T>(*v, key);
    return default_value;
}

template <typename T>
inline Range<T> get_range_opt(const boost::json::object& obj, const char* key, const Range<T>& default_value) {
    if (auto* v = obj.if_contains(key)) return parse_range<T>(*v, key);
    return default_value;
}

// Nested object or an empty one when the section is absent
inline const boost::json::object& get_section(const boost::json::object& obj, const char* key) {
    static const boost::json::object empty;
    auto* v = obj.if_contains(key);
    if (!v) return empty;
    if (!v->is_object()) {
        throw InvalidConfiguration(std::string("expected an object for section: ") + key);
    }
    return v->as_object();
}

// ============================================================================
// File I/O
// ============================================================================

// Read entire file contents into a string
inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace stablesim
