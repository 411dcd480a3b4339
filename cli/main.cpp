/**
 * @file main.cpp
 * @brief udpx-tool: one-shot command line access to the udpx protocol core.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and assemble a udpx::Config:
 *      defaults -> --config <file.json> -> environment -> --magic / --debug.
 *  - Run exactly one subcommand against the core and print one key=value line.
 *
 * Subcommands:
 *   pittle  --from A --to B --length N           pittle=<4 hex>
 *   chonkle --from A --to B --length N           chonkle=<30 hex>
 *   stamp   --from A --to B [--type T] [--payload HEX]
 *                                                packet=<hex>
 *   filter  --from A --to B --packet HEX         type=.. basic=0|1 advanced=0|1 ...
 *   address <text>                               type=.. address=.. slot=..
 *   random  [--bytes N]                          random=<hex>
 *   string  --encode TEXT | --decode HEX         string=<hex> | text=<text>
 *
 * --from / --to fall back to $UDPX_FROM / $UDPX_TO, --config to $UDPX_CONFIG.
 * String records are bounded by Config::max_string_length.
 *
 * Exit codes: 0 ok, 1 packet rejected / I/O failure, 2 bad arguments.
 * Errors print "status=error reason=<token>" on stderr.
 */

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"

#include "udpx/address.hpp"
#include "udpx/byte_cursor.hpp"
#include "udpx/config.hpp"
#include "udpx/inspect.hpp"
#include "udpx/log.hpp"
#include "udpx/packet_filter.hpp"
#include "udpx/packet_tags.hpp"
#include "udpx/random.hpp"

using namespace udpx;

// ---------- small utilities ----------

static constexpr size_t RANDOM_BYTES_MAX = 4096;

static int fail(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return 2;
}

// Resolve an endpoint flag (or its environment fallback); prints the error itself.
static bool endpoint(const std::string& text, const char* which, const char* env_name,
                     Address& out) {
  if (!resolve_endpoint(text, env_name, out)) {
    std::cerr << "status=error reason=bad_address which=" << which << " text=" << text << "\n";
    return false;
  }
  return true;
}

static bool endpoints(const std::string& from_text, const std::string& to_text,
                      Address& from, Address& to) {
  return endpoint(from_text, "from", "UDPX_FROM", from) &&
         endpoint(to_text, "to", "UDPX_TO", to);
}

int main(int argc, char** argv) {
  CLI::App app{"udpx protocol tool"};
  app.require_subcommand(1);

  // ---- global options ----
  std::string config_path = env_get("UDPX_CONFIG", "");
  std::string magic_hex;
  bool debug = false;
  app.add_option("--config", config_path, "JSON config file");
  app.add_option("--magic", magic_hex, "Magic bytes as hex (overrides config/env)");
  app.add_flag("--debug", debug, "Enable debug log lines");

  // ---- shared endpoint options ----
  std::string from_text, to_text;
  uint32_t length = 0;

  CLI::App* pittle = app.add_subcommand("pittle", "Compute the 2-byte Pittle tag");
  pittle->add_option("--from", from_text, "Source ip:port (default $UDPX_FROM)");
  pittle->add_option("--to", to_text, "Destination ip:port (default $UDPX_TO)");
  pittle->add_option("--length", length, "Packet length in bytes")->required();

  CLI::App* chonkle = app.add_subcommand("chonkle", "Compute the 15-byte Chonkle tag");
  chonkle->add_option("--from", from_text, "Source ip:port (default $UDPX_FROM)");
  chonkle->add_option("--to", to_text, "Destination ip:port (default $UDPX_TO)");
  chonkle->add_option("--length", length, "Packet length in bytes")->required();

  unsigned packet_type = PACKET_TYPE_MIN;
  std::string payload_hex;
  CLI::App* stamp = app.add_subcommand("stamp", "Frame a payload with type, Chonkle and Pittle");
  stamp->add_option("--from", from_text, "Source ip:port (default $UDPX_FROM)");
  stamp->add_option("--to", to_text, "Destination ip:port (default $UDPX_TO)");
  stamp->add_option("--type", packet_type, "Packet type (1..99)");
  stamp->add_option("--payload", payload_hex, "Payload bytes as hex");

  std::string packet_hex;
  CLI::App* filter = app.add_subcommand("filter", "Run basic and advanced filters on a packet");
  filter->add_option("--from", from_text, "Source ip:port (default $UDPX_FROM)");
  filter->add_option("--to", to_text, "Destination ip:port (default $UDPX_TO)");
  filter->add_option("--packet", packet_hex, "Packet bytes as hex")->required();

  std::string address_text;
  CLI::App* address = app.add_subcommand("address", "Parse an address and show its wire slot");
  address->add_option("text", address_text, "ip, ip:port or [ipv6]:port")->required();

  size_t random_count = 32;
  CLI::App* random = app.add_subcommand("random", "Print secure random bytes");
  random->add_option("--bytes", random_count, "Number of bytes");

  std::string encode_text, decode_hex;
  CLI::App* str = app.add_subcommand("string", "Encode or decode a length-prefixed string record");
  auto* encode_opt = str->add_option("--encode", encode_text, "Text to encode");
  auto* decode_opt = str->add_option("--decode", decode_hex, "Record bytes as hex");
  encode_opt->excludes(decode_opt);
  str->require_option(1);

  CLI11_PARSE(app, argc, argv);

  // ===== Config assembly =====
  Config cfg;
  std::string err;
  if (!config_path.empty() && !load_config_file(config_path, cfg, err)) return fail(err);
  if (!load_config_from_env(cfg, err)) return fail(err);
  if (!magic_hex.empty() && !parse_magic(magic_hex, cfg.magic)) return fail("bad_magic_hex");
  if (debug) cfg.debug_logs = true;

  Logger log(cfg);
  log.debug("magic=" + to_hex(cfg.magic.data(), cfg.magic.size()));

  // ===== Subcommands =====
  if (pittle->parsed() || chonkle->parsed()) {
    Address from, to;
    if (!endpoints(from_text, to_text, from, to)) return 2;

    if (pittle->parsed()) {
      uint8_t out[PITTLE_BYTES];
      generate_pittle(out, from, to, length);
      std::cout << "pittle=" << to_hex(out, sizeof(out)) << "\n";
    } else {
      uint8_t out[CHONKLE_BYTES];
      generate_chonkle(out, cfg.magic.data(), cfg.magic.size(), from, to, length);
      std::cout << "chonkle=" << to_hex(out, sizeof(out)) << "\n";
    }
    return 0;
  }

  if (stamp->parsed()) {
    Address from, to;
    if (!endpoints(from_text, to_text, from, to)) return 2;
    if (packet_type < PACKET_TYPE_MIN || packet_type > PACKET_TYPE_MAX) return fail("bad_packet_type");

    std::vector<uint8_t> payload;
    if (!parse_hex_bytes(payload_hex, payload)) return fail("bad_payload_hex");

    std::vector<uint8_t> packet(PACKET_MIN_BYTES + payload.size());
    if (!payload.empty())
      std::memcpy(packet.data() + PACKET_PAYLOAD_BEGIN, payload.data(), payload.size());

    if (!stamp_packet(packet.data(), packet.size(), (uint8_t)packet_type,
                      cfg.magic.data(), cfg.magic.size(), from, to)) {
      return fail("stamp_failed");
    }
    log.debug("stamped length=" + std::to_string(packet.size()) +
              " from=" + address_to_string(from).c_str() +
              " to=" + address_to_string(to).c_str());
    std::cout << "packet=" << to_hex(packet.data(), packet.size()) << "\n";
    return 0;
  }

  if (filter->parsed()) {
    Address from, to;
    if (!endpoints(from_text, to_text, from, to)) return 2;

    std::vector<uint8_t> packet;
    if (!parse_hex_bytes(packet_hex, packet)) return fail("bad_packet_hex");

    std::cout << describe_packet(packet.data(), packet.size(),
                                 cfg.magic.data(), cfg.magic.size(), from, to) << "\n";

    const bool ok = basic_packet_filter(packet.data(), packet.size()) &&
                    advanced_packet_filter(packet.data(), cfg.magic.data(), cfg.magic.size(),
                                           from, to, packet.size());
    return ok ? 0 : 1;
  }

  if (address->parsed()) {
    auto a = parse_address(address_text);
    if (!a) return fail("bad_address");
    std::cout << describe_address(*a) << "\n";
    return 0;
  }

  if (random->parsed()) {
    if (random_count > RANDOM_BYTES_MAX) return fail("too_many_bytes");
    std::vector<uint8_t> buf(random_count);
    if (!random_bytes(buf.data(), buf.size())) {
      log.error("random source unavailable");
      return 1;
    }
    std::cout << "random=" << to_hex(buf.data(), buf.size()) << "\n";
    return 0;
  }

  if (str->parsed()) {
    if (encode_opt->count() > 0) {
      if (encode_text.size() > cfg.max_string_length) return fail("string_too_long");
      std::vector<uint8_t> record(4 + encode_text.size());
      size_t w = 0;
      write_string(record.data(), record.size(), w, encode_text, cfg.max_string_length);
      std::cout << "string=" << to_hex(record.data(), w) << "\n";
      return 0;
    }

    std::vector<uint8_t> record;
    if (!parse_hex_bytes(decode_hex, record)) return fail("bad_string_hex");
    std::string text;
    size_t r = 0;
    if (!read_string(record.data(), record.size(), r, text, cfg.max_string_length)) {
      std::cerr << "status=rejected reason=bad_string_record max=" << cfg.max_string_length << "\n";
      return 1;
    }
    std::cout << "text=" << text << " bytes=" << r << "\n";
    return 0;
  }

  return fail("no_command");
}
