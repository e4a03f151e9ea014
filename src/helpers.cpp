#include "chronicle/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <google/protobuf/descriptor.h>

namespace chronicle {
namespace helpers {

std::string oneof_type_name(const google::protobuf::Message& message) {
    const auto* descriptor = message.GetDescriptor();
    if (descriptor->oneof_decl_count() == 0) {
        return std::string(descriptor->name());
    }
    const auto* field = message.GetReflection()->GetOneofFieldDescriptor(
        message, descriptor->oneof_decl(0));
    if (!field) return "";
    if (field->message_type()) {
        return std::string(field->message_type()->name());
    }
    return std::string(field->name());
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string to_iso8601(const google::protobuf::Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.seconds());
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%T") << '.'
       << std::setw(3) << std::setfill('0') << ts.nanos() / 1000000 << 'Z';
    return ss.str();
}

std::string generate_uuid() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    static const char hex[] = "0123456789abcdef";
    std::string uuid(36, ' ');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            uuid[i] = '-';
            continue;
        }
        uuid[i] = hex[nibble(engine)];
    }
    // Set version (4) and variant (8, 9, a, or b)
    uuid[14] = '4';
    uuid[19] = hex[(nibble(engine) % 4) + 8];
    return uuid;
}

uint64_t stream_hash(const std::string& stream_id) {
    // FNV-1a
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : stream_id) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace helpers
} // namespace chronicle
