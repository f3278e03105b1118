#include "Clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
std::tm toUtc(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    return utc;
}
} // namespace

std::string formatIsoDate(std::chrono::system_clock::time_point when) {
    const std::tm utc = toUtc(when);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d");
    return ss.str();
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point when) {
    const std::tm utc = toUtc(when);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}
