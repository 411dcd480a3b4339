/**
 * @file packet_tags.hpp
 * @brief udpx packet tags: Pittle (2 bytes) and Chonkle (15 bytes).
 *
 * Both tags are pure functions of the packet's endpoints and length. They are
 * stamped into every packet so that receivers and middleboxes can discard
 * traffic that was not framed by a udpx participant, before any decryption.
 *
 * ### Pittle
 * 16-bit wrapping sum over the bytes of
 *     from address, from port (LE), to address, to port (LE), length (LE u32)
 * then folded into two obfuscated bytes:
 *     out[0] = 1 | (sum_lo ^ sum_hi ^ 193)
 *     out[1] = 1 | ((255 - out[0]) ^ 113)
 * Cheap enough for a middlebox to recompute on every datagram.
 *
 * ### Chonkle
 * 64-bit FNV-1a over
 *     magic, from address, from port (LE), to address, to port (LE), length (LE u32)
 * with the 8 hash bytes `h[0..7]` (little endian) spread into 15 bytes:
 *
 * | out | formula                               | range       |
 * |-----|---------------------------------------|-------------|
 * | 0   | ((h6 & 0xC0) >> 6) + 42               | 42..45      |
 * | 1   | (h3 & 0x1F) + 200                     | 200..231    |
 * | 2   | ((h2 & 0xFC) >> 2) + 5                | 5..68       |
 * | 3   | h0                                    | 0..255      |
 * | 4   | (h2 & 0x03) + 78                      | 78..81      |
 * | 5   | (h4 & 0x7F) + 96                      | 96..223     |
 * | 6   | ((h1 & 0xFC) >> 2) + 100              | 100..163    |
 * | 7   | (h7 & 1) ? 7 : 79                     | {7, 79}     |
 * | 8   | (h4 & 0x80) ? 83 : 37                 | {37, 83}    |
 * | 9   | (h5 & 0x07) + 124                     | 124..131    |
 * | 10  | ((h1 & 0xE0) >> 5) + 175              | 175..182    |
 * | 11  | (h6 & 0x3F) + 33                      | 33..96      |
 * | 12  | {97, 5, 43, 13}[h1 & 0x03]            | 4 values    |
 * | 13  | ((h5 & 0xF8) >> 3) + 210              | 210..241    |
 * | 14  | ((h7 & 0xFE) >> 1) + 17               | 17..144     |
 *
 * Every row is part of the wire contract. Do not simplify.
 *
 * Lengths are hashed as uint32; callers never build packets anywhere near 4 GiB.
 */

#ifndef UDPX_PACKET_TAGS_HPP
#define UDPX_PACKET_TAGS_HPP

#include "udpx/address.hpp"
#include <stdint.h>
#include <stddef.h>

namespace udpx {

static constexpr size_t   PITTLE_BYTES  = 2;
static constexpr size_t   CHONKLE_BYTES = 15;

static constexpr uint64_t FNV1A_64_OFFSET = 0xcbf29ce484222325ULL;
static constexpr uint64_t FNV1A_64_PRIME  = 0x00000100000001b3ULL;

/// Continue a 64-bit FNV-1a hash over `bytes` bytes. Pass FNV1A_64_OFFSET to start.
uint64_t fnv1a_64(const uint8_t* data, size_t bytes, uint64_t seed = FNV1A_64_OFFSET);

void generate_pittle(uint8_t* out,
                     const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                     const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                     uint32_t packet_length);

void generate_chonkle(uint8_t* out,
                      const uint8_t* magic, size_t magic_bytes,
                      const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                      const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                      uint32_t packet_length);

/// Pittle over two Address values (see address_data() for the byte form).
void generate_pittle(uint8_t* out, const Address& from, const Address& to,
                     uint32_t packet_length);

/// Chonkle over two Address values (see address_data() for the byte form).
void generate_chonkle(uint8_t* out, const uint8_t* magic, size_t magic_bytes,
                      const Address& from, const Address& to, uint32_t packet_length);

} // namespace udpx

#endif // UDPX_PACKET_TAGS_HPP
