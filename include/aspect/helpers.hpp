#pragma once

#include <chrono>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace aspect {

/**
 * Helper functions for protobuf values used by the library.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Convert a system clock time point to a protobuf Timestamp.
 */
google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point time_point);

/**
 * Compare two timestamps: negative if a < b, zero if equal, positive if a > b.
 */
inline int compare(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b) {
    if (a.seconds() != b.seconds()) return a.seconds() < b.seconds() ? -1 : 1;
    if (a.nanos() != b.nanos()) return a.nanos() < b.nanos() ? -1 : 1;
    return 0;
}

/**
 * Generate a random version 4 UUID in canonical text form.
 */
std::string generate_uuid();

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

} // namespace helpers
} // namespace aspect
