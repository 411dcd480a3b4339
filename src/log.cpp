// ============================================================================
// log.cpp: implementation for udpx/log.hpp
// ============================================================================

#include "udpx/log.hpp"
#include "udpx/config.hpp"

#include <cstdlib>     // std::abort
#include <iostream>    // std::cerr

namespace udpx {

Logger::Logger(const Config& cfg)
    : out_(&std::cerr), debug_(cfg.debug_logs) {}

Logger::Logger(const Config& cfg, std::ostream& out)
    : out_(&out), debug_(cfg.debug_logs) {}

void Logger::info(const std::string& msg) const {
    *out_ << msg << "\n";
}

void Logger::error(const std::string& msg) const {
    *out_ << "error: " << msg << "\n";
}

void Logger::debug(const std::string& msg) const {
    if (!debug_) return;
    *out_ << msg << "\n";
}

void fatal(const char* reason) {
    std::cerr << "status=fatal reason=" << (reason ? reason : "unknown") << std::endl;
    std::abort();
}

} // namespace udpx
