#include "util/Time.hpp"

std::string formatLocalTime(std::time_t t, const char* fmt) {
    std::tm tm{};
    if (!localtime_r(&t, &tm)) return "";
    char buff[64];
    std::size_t n = std::strftime(buff, sizeof(buff), fmt, &tm);
    return std::string(buff, n);
}

std::string nowStr() { return formatLocalTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S"); }
