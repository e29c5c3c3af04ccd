#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <chrono>

// Parse an integer from a string.
// Format: decimal with optional sign; the whole string must be consumed.
// Bounds: inclusive [min, max].
// Invalid input sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a byte size with an optional unit suffix.
// Format: unsigned integer followed by B, KB, MB, GB or TB (case-insensitive,
// the trailing B may be omitted).
// Bounds: inclusive [min, max] bytes.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Upper bound accepted by parse_time_ms: one day.
constexpr long long MAX_TIME_MS = 24LL * 60 * 60 * 1000;

// Parse milliseconds with an optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s or m.
// Bounds: at most MAX_TIME_MS.
// Invalid or out-of-range input sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Interpret a config or flag value as a boolean switch.
// Empty, "1", "true", "yes" and "on" are true (case-insensitive).
bool parse_switch(const std::string& value);

#endif // PARSE_UTILS_HPP
