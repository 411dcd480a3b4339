// ============================================================================
// address.cpp: implementation for udpx/address.hpp
// Slot layout and text rules are documented in the header.
// ============================================================================

#include "udpx/address.hpp"
#include "udpx/log.hpp"

#include <arpa/inet.h>   // inet_pton / inet_ntop for the text form
#include <cstdio>        // std::snprintf
#include <cstdlib>       // std::strtoul
#include <cstring>       // std::memset
#include <string>

namespace udpx {

// ---------------------------------------------------------------------------
// Construction / comparison
// ---------------------------------------------------------------------------

Address make_ipv4_address(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port) {
    Address out;
    out.type    = AddressType::IPv4;
    out.ipv4[0] = a;
    out.ipv4[1] = b;
    out.ipv4[2] = c;
    out.ipv4[3] = d;
    out.port    = port;
    return out;
}

Address make_ipv6_address(const uint16_t groups[8], uint16_t port) {
    Address out;
    out.type = AddressType::IPv6;
    for (int i = 0; i < 8; ++i) out.ipv6[i] = groups[i];
    out.port = port;
    return out;
}

bool is_ipv4_mapped(const Address& address) {
    if (address.type != AddressType::IPv6) return false;
    for (int i = 0; i < 5; ++i)
        if (address.ipv6[i] != 0) return false;
    return address.ipv6[5] == 0xFFFF;
}

bool address_equal(const Address& a, const Address& b) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case AddressType::None:
            return true;
        case AddressType::IPv4:
            for (int i = 0; i < 4; ++i) if (a.ipv4[i] != b.ipv4[i]) return false;
            return a.port == b.port;
        case AddressType::IPv6:
            for (int i = 0; i < 8; ++i) if (a.ipv6[i] != b.ipv6[i]) return false;
            return a.port == b.port;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Wire slot
// ---------------------------------------------------------------------------

void write_address(uint8_t* slot, const Address& address) {
    std::memset(slot, 0, ADDRESS_BYTES);     // unused tail bytes are zero

    if (address.type == AddressType::IPv4 || is_ipv4_mapped(address)) {
        slot[0] = (uint8_t)AddressType::IPv4;
        if (address.type == AddressType::IPv4) {
            slot[1] = address.ipv4[0];
            slot[2] = address.ipv4[1];
            slot[3] = address.ipv4[2];
            slot[4] = address.ipv4[3];
        } else {
            // ::ffff:a.b.c.d keeps the IPv4 octets in the last two groups
            slot[1] = (uint8_t)(address.ipv6[6] >> 8);
            slot[2] = (uint8_t)(address.ipv6[6] & 0xFF);
            slot[3] = (uint8_t)(address.ipv6[7] >> 8);
            slot[4] = (uint8_t)(address.ipv6[7] & 0xFF);
        }
        slot[5] = (uint8_t)(address.port & 0xFF);   // port low byte
        slot[6] = (uint8_t)(address.port >> 8);     // port high byte
        return;
    }

    if (address.type == AddressType::IPv6) {
        slot[0] = (uint8_t)AddressType::IPv6;
        for (int i = 0; i < 8; ++i) {
            slot[1 + i * 2]     = (uint8_t)(address.ipv6[i] >> 8);
            slot[1 + i * 2 + 1] = (uint8_t)(address.ipv6[i] & 0xFF);
        }
        slot[17] = (uint8_t)(address.port & 0xFF);
        slot[18] = (uint8_t)(address.port >> 8);
        return;
    }

    slot[0] = (uint8_t)AddressType::None;
}

Address read_address(const uint8_t* slot) {
    Address out;
    switch (slot[0]) {
        case (uint8_t)AddressType::IPv4:
            out.type = AddressType::IPv4;
            for (int i = 0; i < 4; ++i) out.ipv4[i] = slot[1 + i];
            out.port = (uint16_t)(slot[5] | (slot[6] << 8));
            break;
        case (uint8_t)AddressType::IPv6:
            out.type = AddressType::IPv6;
            for (int i = 0; i < 8; ++i)
                out.ipv6[i] = (uint16_t)((slot[1 + i * 2] << 8) | slot[1 + i * 2 + 1]);
            out.port = (uint16_t)(slot[17] | (slot[18] << 8));
            break;
        default:
            break;   // 0 or unknown tag: no address
    }
    return out;
}

void write_address(uint8_t* data, size_t len, size_t& index, const Address& address) {
    if (index > len || len - index < ADDRESS_BYTES) fatal("write_past_end_of_buffer");
    write_address(data + index, address);
    index += ADDRESS_BYTES;
}

bool read_address(const uint8_t* data, size_t len, size_t& index, Address& address) {
    if (index > len || len - index < ADDRESS_BYTES) return false;
    address = read_address(data + index);
    index += ADDRESS_BYTES;
    return true;
}

// ---------------------------------------------------------------------------
// Tag inputs
// ---------------------------------------------------------------------------

void address_data(const Address& address, uint8_t* out, size_t& bytes, uint16_t& port) {
    port = address.port;

    // Same rule as write_address(): a mapped address is an IPv4 endpoint, so
    // both ends hash the 4 bytes a receiver gets back from the slot.
    if (is_ipv4_mapped(address)) {
        out[0] = (uint8_t)(address.ipv6[6] >> 8);
        out[1] = (uint8_t)(address.ipv6[6] & 0xFF);
        out[2] = (uint8_t)(address.ipv6[7] >> 8);
        out[3] = (uint8_t)(address.ipv6[7] & 0xFF);
        bytes = ADDRESS_IPV4_BYTES;
        return;
    }

    switch (address.type) {
        case AddressType::IPv4:
            out[0] = address.ipv4[0];
            out[1] = address.ipv4[1];
            out[2] = address.ipv4[2];
            out[3] = address.ipv4[3];
            bytes = ADDRESS_IPV4_BYTES;
            break;
        case AddressType::IPv6:
            for (int i = 0; i < 8; ++i) {
                out[i * 2]     = (uint8_t)(address.ipv6[i] >> 8);
                out[i * 2 + 1] = (uint8_t)(address.ipv6[i] & 0xFF);
            }
            bytes = ADDRESS_IPV6_BYTES;
            break;
        default:
            bytes = 0;
            break;
    }
}

// ---------------------------------------------------------------------------
// Text form
// ---------------------------------------------------------------------------

AddressStr address_to_string(const Address& address) {
    char buf[ADDRESS_STRING_MAX];

    if (address.type == AddressType::IPv4) {
        std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u:%u",
                      address.ipv4[0], address.ipv4[1], address.ipv4[2], address.ipv4[3],
                      (unsigned)address.port);
        return AddressStr(buf);
    }

    if (address.type == AddressType::IPv6) {
        uint8_t raw[16];
        for (int i = 0; i < 8; ++i) {
            raw[i * 2]     = (uint8_t)(address.ipv6[i] >> 8);
            raw[i * 2 + 1] = (uint8_t)(address.ipv6[i] & 0xFF);
        }
        char host[INET6_ADDRSTRLEN];
        if (!inet_ntop(AF_INET6, raw, host, sizeof(host))) return AddressStr("NONE");
        std::snprintf(buf, sizeof(buf), "[%s]:%u", host, (unsigned)address.port);
        return AddressStr(buf);
    }

    return AddressStr("NONE");
}

// Literal IPv4 or IPv6 host, no port.
static bool parse_host(const std::string& host, Address& out) {
    uint8_t raw[16];
    if (inet_pton(AF_INET, host.c_str(), raw) == 1) {
        out = make_ipv4_address(raw[0], raw[1], raw[2], raw[3], 0);
        return true;
    }
    if (inet_pton(AF_INET6, host.c_str(), raw) == 1) {
        uint16_t groups[8];
        for (int i = 0; i < 8; ++i)
            groups[i] = (uint16_t)((raw[i * 2] << 8) | raw[i * 2 + 1]);
        out = make_ipv6_address(groups, 0);
        return true;
    }
    return false;
}

// Decimal port, 0..65535, no trailing junk.
static bool parse_port(const std::string& s, uint16_t& out) {
    if (s.empty()) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    char* e = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &e, 10);
    if (!e || *e || v > 65535) return false;
    out = (uint16_t)v;
    return true;
}

std::optional<Address> parse_address(std::string_view text) {
    const std::string input(text);
    std::string host;
    std::string port;
    bool has_port = false;

    if (!input.empty() && input[0] == '[') {
        // "[v6]:port"
        size_t close = input.find(']');
        if (close == std::string::npos) return std::nullopt;
        if (close + 1 >= input.size() || input[close + 1] != ':') return std::nullopt;
        host = input.substr(1, close - 1);
        port = input.substr(close + 2);
        has_port = true;
    } else {
        size_t colon = input.rfind(':');
        if (colon != std::string::npos && input.find(':') == colon) {
            // exactly one colon: "host:port"
            host = input.substr(0, colon);
            port = input.substr(colon + 1);
            has_port = true;
        } else {
            // no colon, or several (bare IPv6): the whole text is the host
            host = input;
        }
    }

    Address out;
    if (!parse_host(host, out)) return std::nullopt;
    if (has_port && !parse_port(port, out.port)) return std::nullopt;
    return out;
}

} // namespace udpx
