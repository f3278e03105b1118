#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <string>

// Calendar date of the time point in UTC, formatted YYYY-MM-DD.
std::string formatIsoDate(std::chrono::system_clock::time_point when);

// ISO-8601 UTC timestamp with milliseconds, e.g. 2024-05-01T12:30:00.250Z.
std::string formatIsoTimestamp(std::chrono::system_clock::time_point when);

#endif
