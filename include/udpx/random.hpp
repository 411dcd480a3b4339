/**
 * @file random.hpp
 * @brief Cryptographically secure random bytes from the kernel (/dev/urandom).
 *
 * Used for nonces and key material by the layers above the protocol core.
 * Safe to call from any thread; each call opens and closes its own descriptor.
 */

#ifndef UDPX_RANDOM_HPP
#define UDPX_RANDOM_HPP

#include <stdint.h>
#include <stddef.h>

namespace udpx {

/**
 * @brief Fill `out[0, bytes)` with random bytes.
 * @return false if the device could not be opened or read in full.
 */
bool random_bytes(uint8_t* out, size_t bytes);

} // namespace udpx

#endif // UDPX_RANDOM_HPP
