/**
 * @file inspect.hpp
 * @brief One-line, grep-friendly summaries of packets and address slots.
 *
 * Output is a run of space-separated `key=value` tokens, e.g.
 *
 *     type=0x01 length=20 basic=1 advanced=1 chonkle=2dd8...86 pittle=3bb5
 *     type=ipv4 address=203.0.113.5:40000 slot=01cb007105409c00...
 *
 * Lossy on purpose: meant for operators, logs and shell scripts, not for
 * parsing back.
 */

#ifndef UDPX_INSPECT_HPP
#define UDPX_INSPECT_HPP

#include "udpx/address.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace udpx {

/// "none", "ipv4" or "ipv6".
const char* address_type_name(AddressType type);

/// "type=<family> address=<text> slot=<38 hex>".
std::string describe_address(const Address& address);

/**
 * @brief Summarize a framed packet and both filter verdicts for one context.
 *
 * Packets shorter than the minimum print `status=error reason=too_short length=N`.
 */
std::string describe_packet(const uint8_t* data, size_t packet_length,
                            const uint8_t* magic, size_t magic_bytes,
                            const Address& from, const Address& to);

} // namespace udpx

#endif // UDPX_INSPECT_HPP
