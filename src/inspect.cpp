// ============================================================================
// inspect.cpp: implementation for udpx/inspect.hpp
// ============================================================================

#include "udpx/inspect.hpp"
#include "udpx/config.hpp"          // to_hex()
#include "udpx/packet_filter.hpp"

#include <iomanip>   // std::setw, std::setfill, std::hex
#include <sstream>   // std::ostringstream

namespace udpx {

const char* address_type_name(AddressType type) {
    switch (type) {
        case AddressType::IPv4: return "ipv4";
        case AddressType::IPv6: return "ipv6";
        default:                return "none";
    }
}

std::string describe_address(const Address& address) {
    uint8_t slot[ADDRESS_BYTES];
    write_address(slot, address);

    std::ostringstream os;
    os << "type=" << address_type_name(address.type)
       << " address=" << address_to_string(address).c_str()
       << " slot=" << to_hex(slot, sizeof(slot));
    return os.str();
}

std::string describe_packet(const uint8_t* data, size_t packet_length,
                            const uint8_t* magic, size_t magic_bytes,
                            const Address& from, const Address& to) {
    std::ostringstream os;

    if (packet_length < PACKET_MIN_BYTES) {
        os << "status=error reason=too_short length=" << packet_length;
        return os.str();
    }

    const bool basic    = basic_packet_filter(data, packet_length);
    const bool advanced = advanced_packet_filter(data, magic, magic_bytes, from, to, packet_length);

    // Save/restore stream flags so the hex type byte doesn't leak.
    std::ios_base::fmtflags f0 = os.flags();
    char fill0 = os.fill();
    os << "type=0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(data[0]);
    os.flags(f0);
    os.fill(fill0);

    os << " length=" << packet_length
       << " basic=" << (basic ? 1 : 0)
       << " advanced=" << (advanced ? 1 : 0)
       << " chonkle=" << to_hex(data + PACKET_CHONKLE_BEGIN, CHONKLE_BYTES)
       << " pittle=" << to_hex(data + packet_length - PITTLE_BYTES, PITTLE_BYTES)
       << " payload_bytes=" << (packet_length - PACKET_MIN_BYTES);
    return os.str();
}

} // namespace udpx
