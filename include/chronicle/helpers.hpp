#pragma once

#include <chrono>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/message.h>
#include <google/protobuf/timestamp.pb.h>
#include "chronicle/types.pb.h"

namespace chronicle {

/**
 * Helper functions for working with Chronicle types.
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
 * Name of the message currently held by the first oneof of a tagged-union
 * message, e.g. "Withdrawn" for an AccountEvent holding a Withdrawn.
 * Returns an empty string when no member is set.
 */
std::string oneof_type_name(const google::protobuf::Message& message);

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Convert a protobuf Timestamp to an ISO-8601 UTC string.
 */
std::string to_iso8601(const google::protobuf::Timestamp& ts);

/**
 * Generate a random UUID v4 string.
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

/**
 * Stable 64-bit hash of a stream id, used for partitioning.
 */
uint64_t stream_hash(const std::string& stream_id);

} // namespace helpers
} // namespace chronicle
