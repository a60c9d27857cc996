#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace lw::util {

template <typename Duration>
std::string timestampToIso(const std::chrono::time_point<std::chrono::system_clock, Duration> tp) {
    using namespace std::chrono;
    const auto secs = time_point_cast<seconds>(tp);
    const auto millis = duration_cast<milliseconds>(tp - secs).count();
    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

template <typename Duration>
int64_t toEpochMicros(const std::chrono::time_point<std::chrono::system_clock, Duration> tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds> fromEpochMicros(const int64_t us) {
    return std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>{std::chrono::microseconds{us}};
}

} // namespace lw::util
