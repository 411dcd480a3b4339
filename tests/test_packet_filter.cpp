#include <doctest/doctest.h>
#include "udpx/packet_filter.hpp"

#include <vector>

using namespace udpx;

namespace {

const uint8_t MAGIC[8] = {0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88};

std::vector<uint8_t> stamped(size_t length, const Address& from, const Address& to,
                             uint8_t type = PACKET_TYPE_MIN) {
    std::vector<uint8_t> p(length, 0xAB);
    REQUIRE(stamp_packet(p.data(), p.size(), type, MAGIC, sizeof(MAGIC), from, to));
    return p;
}

} // namespace

TEST_CASE("stamped packet passes both filters") {
    Address from = make_ipv4_address(10, 0, 0, 1, 30000);
    Address to   = make_ipv4_address(10, 0, 0, 2, 40000);
    auto p = stamped(64, from, to);

    CHECK(p[0] == PACKET_TYPE_MIN);
    CHECK(basic_packet_filter(p.data(), p.size()));
    CHECK(advanced_packet_filter(p.data(), MAGIC, sizeof(MAGIC), from, to, p.size()));

    // payload untouched
    for (size_t i = PACKET_PAYLOAD_BEGIN; i < p.size() - PITTLE_BYTES; ++i) CHECK(p[i] == 0xAB);
}

TEST_CASE("any change to a tag byte fails the advanced filter") {
    Address from = make_ipv4_address(192, 168, 1, 5, 5000);
    Address to   = make_ipv4_address(192, 168, 1, 9, 6000);
    auto p = stamped(40, from, to);

    for (size_t i = PACKET_CHONKLE_BEGIN; i < PACKET_PAYLOAD_BEGIN; ++i) {
        auto q = p;
        q[i] ^= 0x01;
        CHECK_FALSE(advanced_packet_filter(q.data(), MAGIC, sizeof(MAGIC), from, to, q.size()));
    }
    for (size_t i = p.size() - PITTLE_BYTES; i < p.size(); ++i) {
        auto q = p;
        q[i] ^= 0x80;
        CHECK_FALSE(advanced_packet_filter(q.data(), MAGIC, sizeof(MAGIC), from, to, q.size()));
    }

    // payload bytes are not covered
    auto q = p;
    q[PACKET_PAYLOAD_BEGIN + 3] ^= 0xFF;
    CHECK(advanced_packet_filter(q.data(), MAGIC, sizeof(MAGIC), from, to, q.size()));
}

TEST_CASE("advanced filter is bound to magic, endpoints and length") {
    Address from = make_ipv4_address(1, 2, 3, 4, 1000);
    Address to   = make_ipv4_address(5, 6, 7, 8, 2000);
    auto p = stamped(32, from, to);

    const uint8_t other_magic[8] = {0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x89};
    CHECK_FALSE(advanced_packet_filter(p.data(), other_magic, 8, from, to, p.size()));
    CHECK_FALSE(advanced_packet_filter(p.data(), MAGIC, 8, to, from, p.size()));
    CHECK_FALSE(advanced_packet_filter(p.data(), MAGIC, 8,
                                       make_ipv4_address(1, 2, 3, 4, 1001), to, p.size()));
    CHECK_FALSE(advanced_packet_filter(p.data(), MAGIC, 8, from, to, p.size() - 1));
}

TEST_CASE("short packets are always rejected") {
    std::vector<uint8_t> p(PACKET_MIN_BYTES, 0);
    Address a = make_ipv4_address(1, 1, 1, 1, 1);

    CHECK_FALSE(basic_packet_filter(p.data(), PACKET_MIN_BYTES - 1));
    CHECK_FALSE(advanced_packet_filter(p.data(), MAGIC, 8, a, a, PACKET_MIN_BYTES - 1));
    CHECK_FALSE(basic_packet_filter(p.data(), 0));

    // 18 bytes with type 0
    CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
}

TEST_CASE("minimum length packet: Chonkle then Pittle, no payload") {
    Address from = make_ipv4_address(1, 2, 3, 4, 1000);
    Address to   = make_ipv4_address(5, 6, 7, 8, 2000);
    auto p = stamped(PACKET_MIN_BYTES, from, to, PACKET_TYPE_MAX);

    CHECK(p[0] == PACKET_TYPE_MAX);
    CHECK(basic_packet_filter(p.data(), p.size()));
    CHECK(advanced_packet_filter(p.data(), MAGIC, sizeof(MAGIC), from, to, p.size()));
}

TEST_CASE("basic filter accepts every stamped header") {
    const uint16_t groups[8] = {0x2001, 0x0db8, 0x85a3, 0, 0, 0x8a2e, 0x0370, 0x7334};
    for (uint16_t port = 1; port < 65000; port += 997) {
        for (size_t len = PACKET_MIN_BYTES; len < 600; len += 61) {
            Address from = make_ipv4_address(172, 16, (uint8_t)(port >> 8), (uint8_t)port, port);
            Address to   = make_ipv6_address(groups, (uint16_t)(port ^ 0x5A5A));
            auto p = stamped(len, from, to, (uint8_t)(1 + port % 99));
            CHECK(basic_packet_filter(p.data(), p.size()));
        }
    }
}

TEST_CASE("basic filter range edges") {
    Address from = make_ipv4_address(1, 2, 3, 4, 1000);
    Address to   = make_ipv4_address(5, 6, 7, 8, 2000);
    auto p = stamped(20, from, to);
    REQUIRE(basic_packet_filter(p.data(), p.size()));

    SUBCASE("type byte") {
        p[0] = 0x00;  CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[0] = 0x64;  CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[0] = 0x63;  CHECK(basic_packet_filter(p.data(), p.size()));
    }
    SUBCASE("byte 1") {
        p[1] = 0x29;  CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[1] = 0x2E;  CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[1] = 0x2A;  CHECK(basic_packet_filter(p.data(), p.size()));
    }
    SUBCASE("byte 4 is unchecked") {
        p[4] = 0x00;  CHECK(basic_packet_filter(p.data(), p.size()));
        p[4] = 0xFF;  CHECK(basic_packet_filter(p.data(), p.size()));
    }
    SUBCASE("byte 8 set") {
        p[8] = 0x07;  CHECK(basic_packet_filter(p.data(), p.size()));
        p[8] = 0x4F;  CHECK(basic_packet_filter(p.data(), p.size()));
        p[8] = 0x08;  CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
    }
    SUBCASE("byte 13 set") {
        const uint8_t ok[] = {0x61, 0x05, 0x2B, 0x0D};
        for (uint8_t v : ok) { p[13] = v; CHECK(basic_packet_filter(p.data(), p.size())); }
        p[13] = 0x62; CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
    }
    SUBCASE("byte 15") {
        p[15] = 0x10; CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[15] = 0x91; CHECK_FALSE(basic_packet_filter(p.data(), p.size()));
        p[15] = 0x90; CHECK(basic_packet_filter(p.data(), p.size()));
    }
}

TEST_CASE("stamp_packet refuses bad input without touching the buffer") {
    Address a = make_ipv4_address(1, 1, 1, 1, 1);
    std::vector<uint8_t> p(PACKET_MIN_BYTES, 0xCD);
    const auto before = p;

    CHECK_FALSE(stamp_packet(p.data(), PACKET_MIN_BYTES - 1, 1, MAGIC, 8, a, a));
    CHECK_FALSE(stamp_packet(p.data(), p.size(), 0, MAGIC, 8, a, a));
    CHECK_FALSE(stamp_packet(p.data(), p.size(), 100, MAGIC, 8, a, a));
    CHECK(p == before);
}

TEST_CASE("IPv4-mapped sender matches the endpoint decoded from its slot") {
    auto from = parse_address("[::ffff:1.2.3.4]:1000");
    REQUIRE(from.has_value());
    Address to = make_ipv4_address(5, 6, 7, 8, 2000);

    auto p = stamped(40, *from, to);

    uint8_t slot[ADDRESS_BYTES];
    write_address(slot, *from);
    Address decoded = read_address(slot);
    REQUIRE(decoded.type == AddressType::IPv4);

    CHECK(advanced_packet_filter(p.data(), MAGIC, sizeof(MAGIC), *from, to, p.size()));
    CHECK(advanced_packet_filter(p.data(), MAGIC, sizeof(MAGIC), decoded, to, p.size()));
    CHECK(advanced_packet_filter(p.data(), MAGIC, sizeof(MAGIC),
                                 make_ipv4_address(1, 2, 3, 4, 1000), to, p.size()));
}
