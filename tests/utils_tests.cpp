#include "test_common.hpp"
#include "help_text.hpp"
#include <cstdint>
#include <sstream>

TEST_CASE("parse_time_ms units") {
    bool ok = false;
    REQUIRE(parse_time_ms("250", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("250ms", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("2s", ok) == std::chrono::milliseconds(2000));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("1m", ok) == std::chrono::milliseconds(60000));
    REQUIRE(ok);
    parse_time_ms("-5", ok);
    REQUIRE_FALSE(ok);
    parse_time_ms("soon", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms rejects delays beyond one day") {
    bool ok = false;
    REQUIRE(parse_time_ms("1440m", ok) == std::chrono::milliseconds(MAX_TIME_MS));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("1441m", ok) == std::chrono::milliseconds(0));
    REQUIRE_FALSE(ok);
    REQUIRE(parse_time_ms("999999999999999999m", ok) == std::chrono::milliseconds(0));
    REQUIRE_FALSE(ok);
    REQUIRE(parse_time_ms("10000000000000000", ok) == std::chrono::milliseconds(0));
    REQUIRE_FALSE(ok);
    parse_time_ms("99999999999999999999999", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units and bounds") {
    bool ok = false;
    REQUIRE(parse_bytes("100", 0, SIZE_MAX, ok) == 100);
    REQUIRE(ok);
    REQUIRE(parse_bytes("1KB", 0, SIZE_MAX, ok) == 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2m", 0, SIZE_MAX, ok) == 2u * 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("5XB", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2KB", 0, 1000, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_int and parse_size_t reject trailing text") {
    bool ok = false;
    REQUIRE(parse_int("16", 0, 100, ok) == 16);
    REQUIRE(ok);
    parse_int("16x", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("200", 0, 100, ok);
    REQUIRE_FALSE(ok);
    REQUIRE(parse_size_t("3", 0, 10, ok) == 3);
    REQUIRE(ok);
    parse_size_t("-3", 0, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_switch accepts common spellings") {
    REQUIRE(parse_switch(""));
    REQUIRE(parse_switch("true"));
    REQUIRE(parse_switch("YES"));
    REQUIRE(parse_switch("1"));
    REQUIRE_FALSE(parse_switch("false"));
    REQUIRE_FALSE(parse_switch("0"));
}

TEST_CASE("format_duration_short") {
    REQUIRE(format_duration_short(std::chrono::seconds(5)) == "5s");
    REQUIRE(format_duration_short(std::chrono::seconds(65)) == "1m5s");
    REQUIRE(format_duration_short(std::chrono::seconds(3600)) == "1h0m0s");
    REQUIRE(format_duration_short(std::chrono::seconds(90061)) == "1d1h1m1s");
}

TEST_CASE("timestamp format") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 19);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[13] == ':');
}

TEST_CASE("print_help lists every option") {
    std::ostringstream oss;
    print_help("deployloop", oss);
    std::string text = oss.str();
    REQUIRE(text.find("Usage: deployloop [options]") != std::string::npos);
    for (const char* flag : {"--repo", "--remote", "--branch", "--worker", "--restart-delay",
                             "--use-credentials", "--config-yaml", "--log-file", "--syslog",
                             "--help", "--version"})
        REQUIRE(text.find(flag) != std::string::npos);
    REQUIRE(text.find("Credentials:") != std::string::npos);
}
