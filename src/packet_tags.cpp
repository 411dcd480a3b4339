// -----------------------------------------------------------------------------
// @file packet_tags.cpp
// @brief Pittle and Chonkle generators.
//
// The output formulas are a literal table shared with every other udpx
// implementation (see packet_tags.hpp). Each line below maps to one row.
// -----------------------------------------------------------------------------

#include "udpx/packet_tags.hpp"

namespace udpx {

uint64_t fnv1a_64(const uint8_t* data, size_t bytes, uint64_t seed) {
    uint64_t hash = seed;
    for (size_t i = 0; i < bytes; ++i) {
        hash ^= data[i];
        hash *= FNV1A_64_PRIME;
    }
    return hash;
}

// Port and length little-endian bytes, shared by both generators.
static inline void le16(uint8_t* out, uint16_t v) {
    out[0] = (uint8_t)(v & 0xFF);
    out[1] = (uint8_t)(v >> 8);
}

static inline void le32(uint8_t* out, uint32_t v) {
    out[0] = (uint8_t)(v & 0xFF);
    out[1] = (uint8_t)((v >> 8)  & 0xFF);
    out[2] = (uint8_t)((v >> 16) & 0xFF);
    out[3] = (uint8_t)((v >> 24) & 0xFF);
}

// =============================================================================
// Pittle
// =============================================================================

void generate_pittle(uint8_t* out,
                     const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                     const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                     uint32_t packet_length) {
    uint8_t from_port_data[2];
    uint8_t to_port_data[2];
    uint8_t length_data[4];
    le16(from_port_data, from_port);
    le16(to_port_data, to_port);
    le32(length_data, packet_length);

    uint16_t sum = 0;   // wraps at 16 bits

    for (size_t i = 0; i < from_bytes; ++i) sum += from_address[i];
    sum += from_port_data[0];
    sum += from_port_data[1];

    for (size_t i = 0; i < to_bytes; ++i) sum += to_address[i];
    sum += to_port_data[0];
    sum += to_port_data[1];

    for (int i = 0; i < 4; ++i) sum += length_data[i];

    const uint8_t sum_lo = (uint8_t)(sum & 0xFF);
    const uint8_t sum_hi = (uint8_t)(sum >> 8);

    out[0] = (uint8_t)(1 | (sum_lo ^ sum_hi ^ 193));
    out[1] = (uint8_t)(1 | ((uint8_t)(255 - out[0]) ^ 113));
}

// =============================================================================
// Chonkle
// =============================================================================

void generate_chonkle(uint8_t* out,
                      const uint8_t* magic, size_t magic_bytes,
                      const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                      const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                      uint32_t packet_length) {
    uint8_t from_port_data[2];
    uint8_t to_port_data[2];
    uint8_t length_data[4];
    le16(from_port_data, from_port);
    le16(to_port_data, to_port);
    le32(length_data, packet_length);

    uint64_t hash = FNV1A_64_OFFSET;
    hash = fnv1a_64(magic, magic_bytes, hash);
    hash = fnv1a_64(from_address, from_bytes, hash);
    hash = fnv1a_64(from_port_data, 2, hash);
    hash = fnv1a_64(to_address, to_bytes, hash);
    hash = fnv1a_64(to_port_data, 2, hash);
    hash = fnv1a_64(length_data, 4, hash);

    uint8_t h[8];
    for (int i = 0; i < 8; ++i) h[i] = (uint8_t)((hash >> (8 * i)) & 0xFF);

    out[0]  = (uint8_t)(((h[6] & 0xC0) >> 6) + 42);
    out[1]  = (uint8_t)((h[3] & 0x1F) + 200);
    out[2]  = (uint8_t)(((h[2] & 0xFC) >> 2) + 5);
    out[3]  = h[0];
    out[4]  = (uint8_t)((h[2] & 0x03) + 78);
    out[5]  = (uint8_t)((h[4] & 0x7F) + 96);
    out[6]  = (uint8_t)(((h[1] & 0xFC) >> 2) + 100);
    out[7]  = (h[7] & 1) == 0 ? 79 : 7;
    out[8]  = (h[4] & 0x80) == 0 ? 37 : 83;
    out[9]  = (uint8_t)((h[5] & 0x07) + 124);
    out[10] = (uint8_t)(((h[1] & 0xE0) >> 5) + 175);
    out[11] = (uint8_t)((h[6] & 0x3F) + 33);

    switch (h[1] & 0x03) {
        case 0:  out[12] = 97; break;
        case 1:  out[12] = 5;  break;
        case 2:  out[12] = 43; break;
        default: out[12] = 13; break;
    }

    out[13] = (uint8_t)(((h[5] & 0xF8) >> 3) + 210);
    out[14] = (uint8_t)(((h[7] & 0xFE) >> 1) + 17);
}

// =============================================================================
// Address overloads
// =============================================================================

void generate_pittle(uint8_t* out, const Address& from, const Address& to,
                     uint32_t packet_length) {
    uint8_t  from_data[ADDRESS_IPV6_BYTES];
    uint8_t  to_data[ADDRESS_IPV6_BYTES];
    size_t   from_bytes, to_bytes;
    uint16_t from_port, to_port;
    address_data(from, from_data, from_bytes, from_port);
    address_data(to, to_data, to_bytes, to_port);

    generate_pittle(out, from_data, from_bytes, from_port,
                    to_data, to_bytes, to_port, packet_length);
}

void generate_chonkle(uint8_t* out, const uint8_t* magic, size_t magic_bytes,
                      const Address& from, const Address& to, uint32_t packet_length) {
    uint8_t  from_data[ADDRESS_IPV6_BYTES];
    uint8_t  to_data[ADDRESS_IPV6_BYTES];
    size_t   from_bytes, to_bytes;
    uint16_t from_port, to_port;
    address_data(from, from_data, from_bytes, from_port);
    address_data(to, to_data, to_bytes, to_port);

    generate_chonkle(out, magic, magic_bytes,
                     from_data, from_bytes, from_port,
                     to_data, to_bytes, to_port, packet_length);
}

} // namespace udpx
