/**
 * @file address.hpp
 * @brief udpx Address: endpoint model and its fixed 19-byte wire slot.
 *
 * Every udpx participant (client, gateway, relay, auth) embeds endpoints in
 * fixed-layout headers. To avoid length fields, an address always occupies
 * the same 19 bytes on the wire regardless of family:
 *
 * | Byte   | None | IPv4                  | IPv6                         |
 * |--------|------|-----------------------|------------------------------|
 * | 0      | 0    | 1                     | 2                            |
 * | 1..4   | 0    | a.b.c.d               | address bytes 0..3           |
 * | 5..6   | 0    | port (low, high)      | address bytes 4..5           |
 * | 7..16  | 0    | 0                     | address bytes 6..15          |
 * | 17..18 | 0    | 0                     | port (low, high)             |
 *
 * IPv6 address bytes are the 16 network-order bytes, i.e. each 16-bit group
 * high byte first. An IPv6 address inside `::ffff:0:0/96` (IPv4-mapped) is
 * written as tag 1, so such an address decodes back as plain IPv4.
 *
 * Decoding an unknown tag is not an error: it yields `AddressType::None`,
 * the same value as an encoded "no address".
 *
 * ### Example
 * @code
 * auto a = udpx::parse_address("203.0.113.5:40000");
 * uint8_t slot[udpx::ADDRESS_BYTES];
 * udpx::write_address(slot, *a);
 * // slot = 01 CB 00 71 05 40 9C 00 ...
 * udpx::Address b = udpx::read_address(slot);
 * @endcode
 */

#ifndef UDPX_ADDRESS_HPP
#define UDPX_ADDRESS_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string_view>

namespace udpx {

static constexpr size_t ADDRESS_BYTES        = 19;  ///< wire slot, every family
static constexpr size_t ADDRESS_IPV4_BYTES   = 4;
static constexpr size_t ADDRESS_IPV6_BYTES   = 16;
static constexpr size_t ADDRESS_STRING_MAX   = 64;  ///< "[v6]:port" fits with headroom

/// Wire tag stored in byte 0 of the slot.
enum class AddressType : uint8_t {
  None = 0,
  IPv4 = 1,
  IPv6 = 2,
};

/// Printable form of an address ("1.2.3.4:80", "[::1]:80", "NONE").
using AddressStr = etl::string<ADDRESS_STRING_MAX>;

/**
 * @struct Address
 * @brief IPv4 or IPv6 endpoint, or nothing.
 *
 * Only the member that matches `type` is meaningful. The other array is kept
 * zeroed by the helpers below so that bytewise comparisons stay stable.
 */
struct Address {
  AddressType type{AddressType::None};
  uint8_t     ipv4[4]{};   ///< a.b.c.d in dotted order
  uint16_t    ipv6[8]{};   ///< eight host-order groups, as written in text
  uint16_t    port{0};
};

Address make_ipv4_address(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port);
Address make_ipv6_address(const uint16_t groups[8], uint16_t port);

/// True for IPv6 addresses of the form ::ffff:a.b.c.d.
bool is_ipv4_mapped(const Address& address);

/// Same family, same address bytes, same port. Two None addresses are equal.
bool address_equal(const Address& a, const Address& b);

inline bool operator==(const Address& a, const Address& b) { return address_equal(a, b); }
inline bool operator!=(const Address& a, const Address& b) { return !address_equal(a, b); }

// -------- wire slot --------

/**
 * @brief Encode `address` into a 19-byte slot.
 * @param slot Destination; must hold ADDRESS_BYTES. All 19 bytes are written.
 */
void write_address(uint8_t* slot, const Address& address);

/**
 * @brief Decode a 19-byte slot.
 * @return The address, or a None address for tag 0 and any unrecognized tag.
 */
Address read_address(const uint8_t* slot);

/// Cursor form: writes a slot at `index` and advances by ADDRESS_BYTES.
/// Insufficient capacity is fatal, like every other writer.
void write_address(uint8_t* data, size_t len, size_t& index, const Address& address);

/// Cursor form: false only if fewer than ADDRESS_BYTES remain.
bool read_address(const uint8_t* data, size_t len, size_t& index, Address& address);

// -------- tag inputs --------

/**
 * @brief Raw address bytes and port as fed to the Chonkle/Pittle generators.
 *
 * - IPv4: the 4 address bytes.
 * - IPv6: 16 bytes, each group high byte first.
 * - IPv4-mapped IPv6 (::ffff:a.b.c.d): the 4 IPv4 bytes, matching the tag 1
 *   slot write_address() produces for it.
 * - None: no bytes.
 *
 * @param out   At least ADDRESS_IPV6_BYTES of storage.
 * @param bytes Number of bytes written to `out`.
 * @param port  The address port (0 for None).
 */
void address_data(const Address& address, uint8_t* out, size_t& bytes, uint16_t& port);

// -------- text form --------

/// "a.b.c.d:port", "[x:x::x]:port" or "NONE".
AddressStr address_to_string(const Address& address);

/**
 * @brief Parse "ip:port", "[ipv6]:port", or a bare IP (port 0).
 * @return std::nullopt if the host part is not a literal IPv4/IPv6 address
 *         or the port is not a number in 0..65535.
 */
std::optional<Address> parse_address(std::string_view text);

} // namespace udpx

#endif // UDPX_ADDRESS_HPP
