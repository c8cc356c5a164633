#pragma once

#include "hybridrag/error.hpp"

#include <boost/json.hpp>

#include <string>

namespace hybridrag::json_util {

// Parses a response body; malformed JSON throws ProtocolError.
inline boost::json::value parse(const std::string& body, const char* what) {
    boost::json::error_code ec;
    boost::json::value value = boost::json::parse(body, ec);
    if (ec) {
        throw ProtocolError(std::string("malformed JSON in ") + what + ": " + ec.message());
    }
    return value;
}

inline const boost::json::object& object_at(const boost::json::value& value, const char* what) {
    if (!value.is_object()) {
        throw ProtocolError(std::string(what) + " is not an object");
    }
    return value.get_object();
}

inline const boost::json::value& field(const boost::json::object& object, const char* key, const char* what) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw ProtocolError(std::string(what) + " has no '" + key + "'");
    }
    return it->value();
}

inline const boost::json::array& array_at(const boost::json::value& value, const char* what) {
    if (!value.is_array()) {
        throw ProtocolError(std::string(what) + " is not an array");
    }
    return value.get_array();
}

inline double number(const boost::json::value& value, const char* what) {
    if (value.is_double()) return value.get_double();
    if (value.is_int64()) return static_cast<double>(value.get_int64());
    if (value.is_uint64()) return static_cast<double>(value.get_uint64());
    throw ProtocolError(std::string(what) + " is not a number");
}

inline std::string string_or(const boost::json::object& object, const char* key, const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || !it->value().is_string()) {
        return fallback;
    }
    return std::string(it->value().get_string());
}

// String form of any scalar, used for metadata values.
inline std::string scalar_to_string(const boost::json::value& value) {
    if (value.is_string()) return std::string(value.get_string());
    return boost::json::serialize(value);
}

} // namespace hybridrag::json_util
