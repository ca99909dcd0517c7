#include "aspect/helpers.hpp"

#include <random>

namespace aspect {
namespace helpers {

google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point time_point) {
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

google::protobuf::Timestamp now() {
    return to_timestamp(std::chrono::system_clock::now());
}

std::string generate_uuid() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string uuid(36, '0');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            uuid[i] = '-';
            continue;
        }
        uuid[i] = hex[digit(engine)];
    }
    // Set version (4) and variant (8, 9, a, or b)
    uuid[14] = '4';
    uuid[19] = hex[(digit(engine) % 4) + 8];
    return uuid;
}

} // namespace helpers
} // namespace aspect
