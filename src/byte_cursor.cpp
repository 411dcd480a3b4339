// -----------------------------------------------------------------------------
// @file byte_cursor.cpp
// @brief Implementation of the udpx little-endian read/write primitives.
//
// Layout and contracts live in byte_cursor.hpp. Here:
// - every multi-byte scalar is assembled by hand, low byte first, so the
//   output never depends on host endianness;
// - floats travel as their bit pattern (memcpy, no arithmetic), which keeps
//   NaN payloads and signed zeros intact;
// - readers check bounds before touching the output or the cursor.
// -----------------------------------------------------------------------------

#include "udpx/byte_cursor.hpp"
#include "udpx/log.hpp"

#include <cstring>   // std::memcpy

namespace udpx {

// =============================================================================
// Bounds helpers
// =============================================================================

// True if `count` bytes starting at `index` lie inside a buffer of `len`.
// Written so that neither side can overflow.
static inline bool fits(size_t len, size_t index, size_t count) {
    return index <= len && count <= len - index;
}

static inline void require_capacity(size_t len, size_t index, size_t count) {
    if (!fits(len, index, count)) fatal("write_past_end_of_buffer");
}

// =============================================================================
// Writers
// =============================================================================

void write_bool(uint8_t* data, size_t len, size_t& index, bool value) {
    require_capacity(len, index, 1);
    data[index] = value ? 1 : 0;
    index += 1;
}

void write_uint8(uint8_t* data, size_t len, size_t& index, uint8_t value) {
    require_capacity(len, index, 1);
    data[index] = value;
    index += 1;
}

void write_uint16(uint8_t* data, size_t len, size_t& index, uint16_t value) {
    require_capacity(len, index, 2);
    data[index]     = (uint8_t)(value & 0xFF);        // low byte first
    data[index + 1] = (uint8_t)(value >> 8);          // high byte
    index += 2;
}

void write_uint32(uint8_t* data, size_t len, size_t& index, uint32_t value) {
    require_capacity(len, index, 4);
    data[index]     = (uint8_t)(value & 0xFF);
    data[index + 1] = (uint8_t)((value >> 8)  & 0xFF);
    data[index + 2] = (uint8_t)((value >> 16) & 0xFF);
    data[index + 3] = (uint8_t)((value >> 24) & 0xFF);
    index += 4;
}

void write_uint64(uint8_t* data, size_t len, size_t& index, uint64_t value) {
    require_capacity(len, index, 8);
    for (int i = 0; i < 8; ++i)
        data[index + i] = (uint8_t)((value >> (8 * i)) & 0xFF);
    index += 8;
}

void write_float32(uint8_t* data, size_t len, size_t& index, float value) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float32 must be 4 bytes");
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_uint32(data, len, index, bits);
}

void write_float64(uint8_t* data, size_t len, size_t& index, double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "float64 must be 8 bytes");
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_uint64(data, len, index, bits);
}

void write_string(uint8_t* data, size_t len, size_t& index,
                  const std::string& value, uint32_t max_length) {
    if (value.size() > max_length) fatal("string_too_long");

    // Check the whole record up front so a fatal stop never leaves a
    // dangling length prefix behind.
    require_capacity(len, index, 4 + value.size());

    write_uint32(data, len, index, (uint32_t)value.size());
    if (!value.empty())
        std::memcpy(data + index, value.data(), value.size());
    index += value.size();
}

void write_bytes(uint8_t* data, size_t len, size_t& index,
                 const uint8_t* value, size_t count) {
    require_capacity(len, index, count);
    if (count)
        std::memcpy(data + index, value, count);
    index += count;
}

// =============================================================================
// Readers
// =============================================================================

bool read_bool(const uint8_t* data, size_t len, size_t& index, bool& value) {
    if (!fits(len, index, 1)) return false;
    value = data[index] > 0;          // any nonzero byte means true
    index += 1;
    return true;
}

bool read_uint8(const uint8_t* data, size_t len, size_t& index, uint8_t& value) {
    if (!fits(len, index, 1)) return false;
    value = data[index];
    index += 1;
    return true;
}

bool read_uint16(const uint8_t* data, size_t len, size_t& index, uint16_t& value) {
    if (!fits(len, index, 2)) return false;
    value = (uint16_t)( (uint16_t)data[index] |
                       ((uint16_t)data[index + 1] << 8) );
    index += 2;
    return true;
}

bool read_uint32(const uint8_t* data, size_t len, size_t& index, uint32_t& value) {
    if (!fits(len, index, 4)) return false;
    value =  (uint32_t)data[index]             |
            ((uint32_t)data[index + 1] << 8)   |
            ((uint32_t)data[index + 2] << 16)  |
            ((uint32_t)data[index + 3] << 24);
    index += 4;
    return true;
}

bool read_uint64(const uint8_t* data, size_t len, size_t& index, uint64_t& value) {
    if (!fits(len, index, 8)) return false;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= (uint64_t)data[index + i] << (8 * i);
    value = v;
    index += 8;
    return true;
}

bool read_float32(const uint8_t* data, size_t len, size_t& index, float& value) {
    uint32_t bits;
    if (!read_uint32(data, len, index, bits)) return false;
    std::memcpy(&value, &bits, sizeof(value));
    return true;
}

bool read_float64(const uint8_t* data, size_t len, size_t& index, double& value) {
    uint64_t bits;
    if (!read_uint64(data, len, index, bits)) return false;
    std::memcpy(&value, &bits, sizeof(value));
    return true;
}

// Shared front half of both read_string overloads: validate the prefix and
// the declared length against the bound and the remaining bytes. On success
// `start` is the first string byte and `length` its size; `index` is untouched.
static bool peek_string(const uint8_t* data, size_t len, size_t index,
                        uint32_t max_length, size_t& start, uint32_t& length) {
    uint32_t declared;
    if (!read_uint32(data, len, index, declared)) return false;
    if (declared > max_length) return false;
    if (!fits(len, index, declared)) return false;
    start  = index;
    length = declared;
    return true;
}

bool read_string(const uint8_t* data, size_t len, size_t& index,
                 std::string& value, uint32_t max_length) {
    size_t   start;
    uint32_t length;
    if (!peek_string(data, len, index, max_length, start, length)) return false;

    value.assign(reinterpret_cast<const char*>(data + start), length);
    index = start + length;
    return true;
}

bool read_string(const uint8_t* data, size_t len, size_t& index,
                 etl::istring& value, uint32_t max_length) {
    size_t   start;
    uint32_t length;
    if (!peek_string(data, len, index, max_length, start, length)) return false;
    if (length > value.max_size()) return false;   // ETL would silently truncate

    value.assign(reinterpret_cast<const char*>(data + start), length);
    index = start + length;
    return true;
}

bool read_bytes(const uint8_t* data, size_t len, size_t& index,
                std::vector<uint8_t>& value, size_t count) {
    if (!fits(len, index, count)) return false;
    value.assign(data + index, data + index + count);
    index += count;
    return true;
}

bool read_bytes(const uint8_t* data, size_t len, size_t& index,
                uint8_t* out, size_t count) {
    if (!fits(len, index, count)) return false;
    if (count)
        std::memcpy(out, data + index, count);
    index += count;
    return true;
}

} // namespace udpx
