// ============================================================================
// config.cpp: implementation for udpx/config.hpp
// JSON via nlohmann::json in its non-throwing parse mode; environment via getenv.
// ============================================================================

#include "udpx/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>     // std::getenv, std::strtoul
#include <fstream>     // std::ifstream for the config file
#include <limits>
#include <sstream>     // slurp the file into a string

using json = nlohmann::json;

namespace udpx {

// ---------------------------------------------------------------------------
// Hex helpers
// ---------------------------------------------------------------------------

static bool hex_char_to_val(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = (uint8_t)(c - '0');      return true; }
    if (c >= 'a' && c <= 'f') { out = (uint8_t)(c - 'a' + 10); return true; }
    if (c >= 'A' && c <= 'F') { out = (uint8_t)(c - 'A' + 10); return true; }
    return false;
}

std::string to_hex(const uint8_t* data, size_t bytes) {
    static const char* DIGITS = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; ++i) {
        out += DIGITS[data[i] >> 4];
        out += DIGITS[data[i] & 0x0F];
    }
    return out;
}

bool parse_hex_bytes(std::string_view text, std::vector<uint8_t>& out) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        text.remove_prefix(2);
    if (text.size() % 2 != 0) return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        uint8_t hi, lo;
        if (!hex_char_to_val(text[i], hi) || !hex_char_to_val(text[i + 1], lo)) return false;
        bytes.push_back((uint8_t)((hi << 4) | lo));
    }
    out.swap(bytes);
    return true;
}

bool parse_magic(std::string_view text, MagicBytes& out) {
    std::vector<uint8_t> bytes;
    if (!parse_hex_bytes(text, bytes)) return false;
    if (bytes.size() > out.max_size()) return false;
    out.assign(bytes.begin(), bytes.end());
    return true;
}

// ---------------------------------------------------------------------------
// JSON file
// ---------------------------------------------------------------------------

bool load_config_json(const std::string& text, Config& cfg, std::string& err) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) { err = "config_not_json";   return false; }
    if (!j.is_object())   { err = "config_not_object"; return false; }

    Config next = cfg;   // commit only if every key checks out

    if (j.contains("debug_logs")) {
        const json& v = j["debug_logs"];
        if (!v.is_boolean()) { err = "debug_logs_not_bool"; return false; }
        next.debug_logs = v.get<bool>();
    }

    if (j.contains("magic")) {
        const json& v = j["magic"];
        if (!v.is_string()) { err = "magic_not_string"; return false; }
        if (!parse_magic(v.get<std::string>(), next.magic)) { err = "bad_magic_hex"; return false; }
    }

    if (j.contains("max_string_length")) {
        const json& v = j["max_string_length"];
        if (!v.is_number_unsigned()) { err = "max_string_length_not_unsigned"; return false; }
        uint64_t n = v.get<uint64_t>();
        if (n > std::numeric_limits<uint32_t>::max()) { err = "max_string_length_too_large"; return false; }
        next.max_string_length = (uint32_t)n;
    }

    cfg = next;
    return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_open_failed"; return false; }

    std::ostringstream ss;
    ss << in.rdbuf();
    return load_config_json(ss.str(), cfg, err);
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------

std::string env_get(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

bool env_get_address(const char* name, const Address& fallback, Address& out) {
    const char* v = std::getenv(name);
    if (!v) { out = fallback; return true; }

    auto parsed = parse_address(v);
    if (!parsed) return false;
    out = *parsed;
    return true;
}

bool resolve_endpoint(const std::string& text, const char* env_name, Address& out) {
    if (!text.empty()) {
        auto parsed = parse_address(text);
        if (!parsed) return false;
        out = *parsed;
        return true;
    }
    if (env_get(env_name, "").empty()) return false;
    return env_get_address(env_name, Address{}, out);
}

bool load_config_from_env(Config& cfg, std::string& err) {
    Config next = cfg;

    if (const char* v = std::getenv("NEXT_DEBUG_LOGS"); v && std::string(v) == "1")
        next.debug_logs = true;

    if (const char* v = std::getenv("UDPX_MAGIC"); v) {
        if (!parse_magic(v, next.magic)) { err = "bad_UDPX_MAGIC"; return false; }
    }

    if (const char* v = std::getenv("UDPX_MAX_STRING_LENGTH"); v) {
        char* e = nullptr;
        unsigned long long n = std::strtoull(v, &e, 10);
        if (!*v || !e || *e || n > std::numeric_limits<uint32_t>::max()) {
            err = "bad_UDPX_MAX_STRING_LENGTH";
            return false;
        }
        next.max_string_length = (uint32_t)n;
    }

    cfg = next;
    return true;
}

} // namespace udpx
