/**
 * @file config.hpp
 * @brief udpx configuration: one explicit struct, filled from defaults, a JSON file and the environment.
 *
 * Nothing in the protocol core reads the environment or a global. Processes
 * build a `Config` once at startup and pass it (or the pieces they need) to
 * whatever they construct: `Logger`, the packet stamping path, the CLI.
 *
 * Precedence, lowest to highest:
 *   1. built-in defaults (below),
 *   2. `load_config_file()`: JSON object, all keys optional:
 *      @code
 *      { "debug_logs": true, "magic": "0011223344556677", "max_string_length": 1024 }
 *      @endcode
 *   3. `load_config_from_env()`:
 *      - `NEXT_DEBUG_LOGS=1`       enable debug lines
 *      - `UDPX_MAGIC=<hex>`        magic bytes
 *      - `UDPX_MAX_STRING_LENGTH`  bound for string fields
 *   4. command-line flags (cli/main.cpp).
 *
 * Loaders never throw. They return false with a short reason in `err` and
 * leave `cfg` exactly as it was.
 */

#ifndef UDPX_CONFIG_HPP
#define UDPX_CONFIG_HPP

#include "udpx/address.hpp"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <string_view>
#include <vector>

namespace udpx {

static constexpr size_t   MAGIC_MAX_BYTES            = 64;
static constexpr size_t   MAGIC_DEFAULT_BYTES        = 8;
static constexpr uint32_t MAX_STRING_LENGTH_DEFAULT  = 256;

/// Shared protocol magic, bounded so a config typo cannot grow it without limit.
using MagicBytes = etl::vector<uint8_t, MAGIC_MAX_BYTES>;

struct Config {
  bool       debug_logs{false};
  MagicBytes magic = MagicBytes(MAGIC_DEFAULT_BYTES, 0);   ///< 8 zero bytes
  uint32_t   max_string_length{MAX_STRING_LENGTH_DEFAULT};
};

/// Apply a JSON config file on top of `cfg`.
bool load_config_file(const std::string& path, Config& cfg, std::string& err);

/// Apply the JSON text of a config file on top of `cfg`.
bool load_config_json(const std::string& text, Config& cfg, std::string& err);

/// Apply environment overrides on top of `cfg`.
bool load_config_from_env(Config& cfg, std::string& err);

// -------- environment helpers --------

/// Value of `name`, or `fallback` if unset.
std::string env_get(const char* name, const std::string& fallback);

/**
 * @brief Address from environment variable `name`, or `fallback` if unset.
 * @return false if the variable is set but does not parse as an address.
 */
bool env_get_address(const char* name, const Address& fallback, Address& out);

/**
 * @brief Endpoint for a tool option: `text` if given, else environment `env_name`.
 * @return false if neither is set or the chosen text is not an address.
 */
bool resolve_endpoint(const std::string& text, const char* env_name, Address& out);

// -------- hex helpers --------

/// Lower-case hex, two digits per byte.
std::string to_hex(const uint8_t* data, size_t bytes);

/// Parse an even-length hex string (optional "0x" prefix, either case).
bool parse_hex_bytes(std::string_view text, std::vector<uint8_t>& out);

/// Parse hex into a MagicBytes; fails if longer than MAGIC_MAX_BYTES.
bool parse_magic(std::string_view text, MagicBytes& out);

} // namespace udpx

#endif // UDPX_CONFIG_HPP
