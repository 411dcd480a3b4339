/**
 * @file byte_cursor.hpp
 * @brief udpx ByteCursor: little-endian read/write primitives over caller-owned buffers.
 *
 * Every udpx packet, token and header is assembled and taken apart with the
 * functions declared here. They share one calling convention:
 *
 *     write_T(data, len, index, value)        // trusts the caller
 *     read_T (data, len, index, value) -> bool // never trusts the bytes
 *
 * where `data`/`len` describe the buffer and `index` is the cursor. The cursor
 * is advanced by every successful call and is the single record of how many
 * bytes have been produced or consumed.
 *
 * ### Wire encodings
 *
 * | Type        | Bytes   | Encoding                                       |
 * |-------------|---------|------------------------------------------------|
 * | bool        | 1       | 0 = false, anything else reads as true         |
 * | uint8..64   | 1/2/4/8 | little endian                                  |
 * | float32/64  | 4/8     | IEEE-754 bit pattern as uint32/uint64, LE      |
 * | string      | 4 + n   | uint32 LE length, then n raw bytes             |
 * | bytes       | n       | raw, count agreed out of band                  |
 *
 * ### Two error regimes
 * - **Writes** come from internal state, and every call site sizes its buffer
 *   up front. Running past `len` or writing a string longer than its maximum
 *   is a programming error: the call reports through `udpx::fatal()` and the
 *   process stops. Nothing is truncated.
 * - **Reads** consume untrusted bytes. Any shortfall returns `false` and
 *   leaves both `index` and the output exactly as they were.
 *
 * ### Example
 * @code
 * uint8_t buf[64];
 * size_t  w = 0;
 * udpx::write_uint16(buf, sizeof(buf), w, 40000);
 * udpx::write_string(buf, sizeof(buf), w, "hello", 32);
 *
 * size_t   r = 0;
 * uint16_t port;
 * std::string s;
 * if (!udpx::read_uint16(buf, w, r, port) ||
 *     !udpx::read_string(buf, w, r, s, 32)) {
 *     // drop the packet
 * }
 * @endcode
 *
 * @note Stateless and reentrant. Concurrent calls are safe as long as each
 *       thread works on its own buffer and cursor.
 */

#ifndef UDPX_BYTE_CURSOR_HPP
#define UDPX_BYTE_CURSOR_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace udpx {

// =============================================================================
// Writers (caller guarantees capacity; violations are fatal)
// =============================================================================

void write_bool   (uint8_t* data, size_t len, size_t& index, bool value);
void write_uint8  (uint8_t* data, size_t len, size_t& index, uint8_t value);
void write_uint16 (uint8_t* data, size_t len, size_t& index, uint16_t value);
void write_uint32 (uint8_t* data, size_t len, size_t& index, uint32_t value);
void write_uint64 (uint8_t* data, size_t len, size_t& index, uint64_t value);

/// Writes the raw IEEE-754 bits of `value` as a little-endian uint32.
void write_float32(uint8_t* data, size_t len, size_t& index, float value);

/// Writes the raw IEEE-754 bits of `value` as a little-endian uint64.
void write_float64(uint8_t* data, size_t len, size_t& index, double value);

/**
 * @brief Write a uint32 length prefix followed by the string bytes.
 * @param max_length Largest length the receiver will accept. Exceeding it is fatal.
 */
void write_string(uint8_t* data, size_t len, size_t& index,
                  const std::string& value, uint32_t max_length);

/**
 * @brief Copy `count` bytes from `value` verbatim.
 * @param value Source; must hold at least `count` bytes.
 */
void write_bytes(uint8_t* data, size_t len, size_t& index,
                 const uint8_t* value, size_t count);

// =============================================================================
// Readers (bounds-checked; false leaves index and output untouched)
// =============================================================================

bool read_bool   (const uint8_t* data, size_t len, size_t& index, bool& value);
bool read_uint8  (const uint8_t* data, size_t len, size_t& index, uint8_t& value);
bool read_uint16 (const uint8_t* data, size_t len, size_t& index, uint16_t& value);
bool read_uint32 (const uint8_t* data, size_t len, size_t& index, uint32_t& value);
bool read_uint64 (const uint8_t* data, size_t len, size_t& index, uint64_t& value);
bool read_float32(const uint8_t* data, size_t len, size_t& index, float& value);
bool read_float64(const uint8_t* data, size_t len, size_t& index, double& value);

/**
 * @brief Read a length-prefixed string.
 *
 * Fails when the prefix is truncated, when the declared length exceeds
 * `max_length`, or when fewer than the declared bytes remain. The declared
 * length is validated before anything is allocated, so a hostile prefix
 * cannot force a large allocation.
 */
bool read_string(const uint8_t* data, size_t len, size_t& index,
                 std::string& value, uint32_t max_length);

/**
 * @brief Read a length-prefixed string into a fixed-capacity ETL string.
 *
 * Same contract as the std::string overload; a declared length beyond
 * `value.max_size()` is rejected as well.
 */
bool read_string(const uint8_t* data, size_t len, size_t& index,
                 etl::istring& value, uint32_t max_length);

/// Read exactly `count` raw bytes into `value` (resized to `count`).
bool read_bytes(const uint8_t* data, size_t len, size_t& index,
                std::vector<uint8_t>& value, size_t count);

/// Read exactly `count` raw bytes into caller storage at `out`.
bool read_bytes(const uint8_t* data, size_t len, size_t& index,
                uint8_t* out, size_t count);

} // namespace udpx

#endif // UDPX_BYTE_CURSOR_HPP
