#include "time_utils.hpp"
#include <ctime>

std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count() < 0 ? 0 : dur.count();
    long long d = total / 86400;
    long long h = (total / 3600) % 24;
    long long m = (total / 60) % 60;
    long long s = total % 60;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (d > 0 || h > 0)
        out += std::to_string(h) + "h";
    if (d > 0 || h > 0 || m > 0)
        out += std::to_string(m) + "m";
    return out + std::to_string(s) + "s";
}
