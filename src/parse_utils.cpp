#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::logic_error&) {
        return 0;
    }
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lowercase(value);
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty() && !std::isdigit(static_cast<unsigned char>(val.back()))) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        case 't':
            mult = 1024ull * 1024 * 1024 * 1024;
            break;
        default:
            return 0;
        }
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string num = lowercase(value);
    long long mult = 1;
    auto strip = [&](const std::string& suffix) {
        if (num.size() > suffix.size() &&
            num.compare(num.size() - suffix.size(), suffix.size(), suffix) == 0) {
            num.erase(num.size() - suffix.size());
            return true;
        }
        return false;
    };
    if (strip("ms"))
        mult = 1;
    else if (strip("s"))
        mult = 1000;
    else if (strip("m"))
        mult = 60 * 1000;
    if (!all_digits(num))
        return std::chrono::milliseconds(0);
    try {
        long long n = std::stoll(num);
        if (n > MAX_TIME_MS / mult)
            return std::chrono::milliseconds(0);
        ok = true;
        return std::chrono::milliseconds(n * mult);
    } catch (const std::out_of_range&) {
        return std::chrono::milliseconds(0);
    }
}

bool parse_switch(const std::string& value) {
    std::string v = lowercase(value);
    return v.empty() || v == "1" || v == "true" || v == "yes" || v == "on";
}
