/**
 * @file packet_filter.hpp
 * @brief udpx packet filters: cheap admission tests run before any decryption.
 *
 * Every udpx packet on the wire has the same frame:
 *
 * | Bytes              | Contents                              |
 * |--------------------|---------------------------------------|
 * | [0]                | packet type, 0x01..0x63               |
 * | [1, 16)            | Chonkle tag (15 bytes)                |
 * | [16, length - 2)   | payload                               |
 * | [length - 2, len)  | Pittle tag (2 bytes)                  |
 *
 * Minimum length is 18 (header + trailer, empty payload).
 *
 * Receivers run the two stages in order:
 *  1. `basic_packet_filter()`: no keys, range checks on bytes 0..15.
 *     Rejects random junk at near-zero cost. Byte 4 (Chonkle out[3]) is the
 *     raw hash byte and can take any value, so it is not checked.
 *  2. `advanced_packet_filter()`: recomputes both tags for the claimed
 *     (magic, from, to, length) and requires an exact match.
 *
 * Both return a plain accept/reject. There is no reason code: a rejected
 * packet is dropped, and a caller that wants to know more logs it itself.
 *
 * `stamp_packet()` is the sender half: it writes the type byte and both tags
 * into an already-sized buffer so the result passes both filters.
 */

#ifndef UDPX_PACKET_FILTER_HPP
#define UDPX_PACKET_FILTER_HPP

#include "udpx/address.hpp"
#include "udpx/packet_tags.hpp"
#include <stdint.h>
#include <stddef.h>

namespace udpx {

static constexpr size_t  PACKET_MIN_BYTES    = 1 + CHONKLE_BYTES + PITTLE_BYTES;  ///< 18
static constexpr size_t  PACKET_CHONKLE_BEGIN = 1;
static constexpr size_t  PACKET_PAYLOAD_BEGIN = PACKET_CHONKLE_BEGIN + CHONKLE_BYTES; ///< 16
static constexpr uint8_t PACKET_TYPE_MIN     = 0x01;
static constexpr uint8_t PACKET_TYPE_MAX     = 0x63;

/**
 * @brief Range-check the header bytes.
 * @param data          Packet bytes; at least `packet_length` readable.
 * @param packet_length Datagram length.
 * @return false for packets shorter than PACKET_MIN_BYTES or any byte out of range.
 */
bool basic_packet_filter(const uint8_t* data, size_t packet_length);

/**
 * @brief Recompute Chonkle and Pittle and compare against the packet.
 * @return true only if bytes [1,16) equal the Chonkle tag and the last two
 *         bytes equal the Pittle tag for this exact context.
 */
bool advanced_packet_filter(const uint8_t* data,
                            const uint8_t* magic, size_t magic_bytes,
                            const uint8_t* from_address, size_t from_bytes, uint16_t from_port,
                            const uint8_t* to_address, size_t to_bytes, uint16_t to_port,
                            size_t packet_length);

bool advanced_packet_filter(const uint8_t* data,
                            const uint8_t* magic, size_t magic_bytes,
                            const Address& from, const Address& to,
                            size_t packet_length);

/**
 * @brief Write type byte, Chonkle and Pittle into `data[0, packet_length)`.
 *
 * The payload region is left untouched.
 *
 * @return false, with `data` unmodified, if `packet_length` < PACKET_MIN_BYTES
 *         or `packet_type` is outside [PACKET_TYPE_MIN, PACKET_TYPE_MAX].
 */
bool stamp_packet(uint8_t* data, size_t packet_length, uint8_t packet_type,
                  const uint8_t* magic, size_t magic_bytes,
                  const Address& from, const Address& to);

} // namespace udpx

#endif // UDPX_PACKET_FILTER_HPP
