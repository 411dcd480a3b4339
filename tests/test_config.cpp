#include <doctest/doctest.h>
#include "udpx/config.hpp"
#include "udpx/byte_cursor.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <utility>

using namespace udpx;

TEST_CASE("defaults") {
    Config cfg;
    CHECK_FALSE(cfg.debug_logs);
    CHECK(cfg.magic.size() == MAGIC_DEFAULT_BYTES);
    for (uint8_t b : cfg.magic) CHECK(b == 0);
    CHECK(cfg.max_string_length == MAX_STRING_LENGTH_DEFAULT);
}

TEST_CASE("hex helpers") {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    CHECK(to_hex(bytes, sizeof(bytes)) == "000fa0ff");
    CHECK(to_hex(bytes, 0).empty());

    std::vector<uint8_t> out;
    REQUIRE(parse_hex_bytes("000FA0ff", out));
    CHECK(out == std::vector<uint8_t>(bytes, bytes + 4));

    REQUIRE(parse_hex_bytes("0x0102", out));
    CHECK(out == std::vector<uint8_t>{0x01, 0x02});

    REQUIRE(parse_hex_bytes("", out));
    CHECK(out.empty());

    out = {9};
    CHECK_FALSE(parse_hex_bytes("abc", out));
    CHECK_FALSE(parse_hex_bytes("zz", out));
    CHECK(out == std::vector<uint8_t>{9});
}

TEST_CASE("parse_magic respects the capacity") {
    MagicBytes m;
    REQUIRE(parse_magic("7564707874657374", m));
    CHECK(m.size() == 8);
    CHECK(m[0] == 'u');
    CHECK(m[7] == 't');

    std::string too_long(2 * (MAGIC_MAX_BYTES + 1), 'a');
    CHECK_FALSE(parse_magic(too_long, m));
    CHECK(m.size() == 8);
}

TEST_CASE("JSON config") {
    Config cfg;
    std::string err;

    SUBCASE("all keys") {
        REQUIRE(load_config_json(R"({"debug_logs":true,"magic":"0102","max_string_length":32})", cfg, err));
        CHECK(cfg.debug_logs);
        CHECK(cfg.magic.size() == 2);
        CHECK(cfg.magic[1] == 0x02);
        CHECK(cfg.max_string_length == 32);
    }
    SUBCASE("missing keys keep current values") {
        REQUIRE(load_config_json("{}", cfg, err));
        CHECK(cfg.magic.size() == MAGIC_DEFAULT_BYTES);
        CHECK(cfg.max_string_length == MAX_STRING_LENGTH_DEFAULT);
    }
    SUBCASE("errors leave cfg untouched") {
        const std::pair<const char*, const char*> cases[] = {
            {"not json",                             "config_not_json"},
            {"[1,2]",                                "config_not_object"},
            {R"({"debug_logs":"yes"})",              "debug_logs_not_bool"},
            {R"({"magic":12})",                      "magic_not_string"},
            {R"({"magic":"xyz"})",                   "bad_magic_hex"},
            {R"({"max_string_length":-1})",          "max_string_length_not_unsigned"},
            {R"({"max_string_length":5000000000})",  "max_string_length_too_large"},
            {R"({"debug_logs":true,"magic":"q"})",   "bad_magic_hex"},
        };
        for (const auto& c : cases) {
            Config before;
            Config cur = before;
            err.clear();
            CHECK_FALSE(load_config_json(c.first, cur, err));
            CHECK(err == c.second);
            CHECK(cur.debug_logs == before.debug_logs);
            CHECK(cur.magic.size() == before.magic.size());
        }
    }
}

TEST_CASE("config file") {
    Config cfg;
    std::string err;
    CHECK_FALSE(load_config_file("/nonexistent/udpx.json", cfg, err));
    CHECK(err == "config_open_failed");

    const char* path = "udpx_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"max_string_length": 7})";
    }
    REQUIRE(load_config_file(path, cfg, err));
    CHECK(cfg.max_string_length == 7);
    std::remove(path);
}

TEST_CASE("environment overrides") {
    Config cfg;
    std::string err;

    ::setenv("NEXT_DEBUG_LOGS", "1", 1);
    ::setenv("UDPX_MAGIC", "aabb", 1);
    ::setenv("UDPX_MAX_STRING_LENGTH", "99", 1);
    REQUIRE(load_config_from_env(cfg, err));
    CHECK(cfg.debug_logs);
    CHECK(cfg.magic.size() == 2);
    CHECK(cfg.magic[0] == 0xaa);
    CHECK(cfg.max_string_length == 99);

    ::setenv("UDPX_MAX_STRING_LENGTH", "12abc", 1);
    Config other;
    CHECK_FALSE(load_config_from_env(other, err));
    CHECK(err == "bad_UDPX_MAX_STRING_LENGTH");
    CHECK_FALSE(other.debug_logs);

    ::unsetenv("UDPX_MAX_STRING_LENGTH");
    ::setenv("UDPX_MAGIC", "not-hex", 1);
    CHECK_FALSE(load_config_from_env(other, err));
    CHECK(err == "bad_UDPX_MAGIC");

    ::unsetenv("UDPX_MAGIC");
    ::setenv("NEXT_DEBUG_LOGS", "0", 1);
    Config quiet;
    REQUIRE(load_config_from_env(quiet, err));
    CHECK_FALSE(quiet.debug_logs);
    ::unsetenv("NEXT_DEBUG_LOGS");
}

TEST_CASE("env helpers") {
    ::unsetenv("UDPX_TEST_UNSET");
    CHECK(env_get("UDPX_TEST_UNSET", "fallback") == "fallback");

    ::setenv("UDPX_TEST_ADDR", "10.0.0.1:5000", 1);
    Address a;
    REQUIRE(env_get_address("UDPX_TEST_ADDR", Address{}, a));
    CHECK(a == make_ipv4_address(10, 0, 0, 1, 5000));

    ::setenv("UDPX_TEST_ADDR", "bogus", 1);
    CHECK_FALSE(env_get_address("UDPX_TEST_ADDR", Address{}, a));

    Address fallback = make_ipv4_address(127, 0, 0, 1, 1);
    REQUIRE(env_get_address("UDPX_TEST_UNSET", fallback, a));
    CHECK(a == fallback);
    ::unsetenv("UDPX_TEST_ADDR");
}

TEST_CASE("resolve_endpoint: option text first, then the environment") {
    Address a;
    ::unsetenv("UDPX_TEST_FROM");
    CHECK_FALSE(resolve_endpoint("", "UDPX_TEST_FROM", a));

    ::setenv("UDPX_TEST_FROM", "[2001:db8::1]:50000", 1);
    REQUIRE(resolve_endpoint("", "UDPX_TEST_FROM", a));
    CHECK(a.type == AddressType::IPv6);
    CHECK(a.port == 50000);

    // explicit text wins over the variable
    REQUIRE(resolve_endpoint("1.2.3.4:1000", "UDPX_TEST_FROM", a));
    CHECK(a == make_ipv4_address(1, 2, 3, 4, 1000));
    CHECK_FALSE(resolve_endpoint("nope", "UDPX_TEST_FROM", a));

    ::setenv("UDPX_TEST_FROM", "garbage", 1);
    CHECK_FALSE(resolve_endpoint("", "UDPX_TEST_FROM", a));
    ::unsetenv("UDPX_TEST_FROM");
}

TEST_CASE("max_string_length from config bounds string records") {
    Config cfg;
    std::string err;
    REQUIRE(load_config_json(R"({"max_string_length":4})", cfg, err));

    uint8_t buf[32];
    size_t w = 0;
    write_string(buf, sizeof(buf), w, std::string("abcd"), cfg.max_string_length);
    write_string(buf, sizeof(buf), w, std::string("abcde"), 8);

    size_t r = 0;
    std::string s;
    REQUIRE(read_string(buf, w, r, s, cfg.max_string_length));
    CHECK(s == "abcd");
    const size_t before = r;
    CHECK_FALSE(read_string(buf, w, r, s, cfg.max_string_length));
    CHECK(r == before);
    CHECK(s == "abcd");
}
