// ============================================================================
// packet_filter.cpp: implementation for udpx/packet_filter.hpp
// ============================================================================

#include "udpx/packet_filter.hpp"

#include <cstring>   // std::memcmp

namespace udpx {

// Inclusive byte range check.
static inline bool in_range(uint8_t v, uint8_t lo, uint8_t hi) {
    return v >= lo && v <= hi;
}

// ---------------------------------------------------------------------------
// basic_packet_filter()
// ---------------------------------------------------------------------------
// Bytes 1..15 are Chonkle out[0..14]; each range is the set of values that
// row of the Chonkle table can produce (byte 7 is a little wider on purpose).
// ---------------------------------------------------------------------------
bool basic_packet_filter(const uint8_t* data, size_t packet_length) {
    if (packet_length < PACKET_MIN_BYTES) return false;

    if (!in_range(data[0],  PACKET_TYPE_MIN, PACKET_TYPE_MAX)) return false;
    if (!in_range(data[1],  0x2A, 0x2D)) return false;
    if (!in_range(data[2],  0xC8, 0xE7)) return false;
    if (!in_range(data[3],  0x05, 0x44)) return false;
    // data[4]: raw hash byte, any value
    if (!in_range(data[5],  0x4E, 0x51)) return false;
    if (!in_range(data[6],  0x60, 0xDF)) return false;
    if (!in_range(data[7],  0x64, 0xE3)) return false;
    if (data[8] != 0x07 && data[8] != 0x4F) return false;
    if (data[9] != 0x25 && data[9] != 0x53) return false;
    if (!in_range(data[10], 0x7C, 0x83)) return false;
    if (!in_range(data[11], 0xAF, 0xB6)) return false;
    if (!in_range(data[12], 0x21, 0x60)) return false;
    if (data[13] != 0x61 && data[13] != 0x05 &&
        data[13] != 0x2B && data[13] != 0x0D) return false;
    if (!in_range(data[14], 0xD2, 0xF1)) return false;
    if (!in_range(data[15], 0x11, 0x90)) return false;

    return true;
}

// ---------------------------------------------------------------------------
// advanced_packet_filter()
// ---------------------------------------------------------------------------

bool advanced_packet_filter(const uint8_t* data,
                            const uint8_t* magic, size_t magic_bytes,
                            const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                            const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                            size_t packet_length) {
    if (packet_length < PACKET_MIN_BYTES) return false;

    uint8_t chonkle[CHONKLE_BYTES];
    uint8_t pittle[PITTLE_BYTES];
    generate_chonkle(chonkle, magic, magic_bytes,
                     from_address, from_bytes, from_port,
                     to_address, to_bytes, to_port, (uint32_t)packet_length);
    generate_pittle(pittle, from_address, from_bytes, from_port,
                    to_address, to_bytes, to_port, (uint32_t)packet_length);

    if (std::memcmp(chonkle, data + PACKET_CHONKLE_BEGIN, CHONKLE_BYTES) != 0) return false;
    if (std::memcmp(pittle, data + packet_length - PITTLE_BYTES, PITTLE_BYTES) != 0) return false;
    return true;
}

bool advanced_packet_filter(const uint8_t* data,
                            const uint8_t* magic, size_t magic_bytes,
                            const Address& from, const Address& to,
                            size_t packet_length) {
    uint8_t  from_data[ADDRESS_IPV6_BYTES];
    uint8_t  to_data[ADDRESS_IPV6_BYTES];
    size_t   from_bytes, to_bytes;
    uint16_t from_port, to_port;
    address_data(from, from_data, from_bytes, from_port);
    address_data(to, to_data, to_bytes, to_port);

    return advanced_packet_filter(data, magic, magic_bytes,
                                  from_data, from_bytes, from_port,
                                  to_data, to_bytes, to_port, packet_length);
}

// ---------------------------------------------------------------------------
// stamp_packet()
// ---------------------------------------------------------------------------

bool stamp_packet(uint8_t* data, size_t packet_length, uint8_t packet_type,
                  const uint8_t* magic, size_t magic_bytes,
                  const Address& from, const Address& to) {
    if (packet_length < PACKET_MIN_BYTES) return false;
    if (!in_range(packet_type, PACKET_TYPE_MIN, PACKET_TYPE_MAX)) return false;

    data[0] = packet_type;
    generate_chonkle(data + PACKET_CHONKLE_BEGIN, magic, magic_bytes,
                     from, to, (uint32_t)packet_length);
    generate_pittle(data + packet_length - PITTLE_BYTES, from, to,
                    (uint32_t)packet_length);
    return true;
}

} // namespace udpx
