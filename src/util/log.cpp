/*
 * GChat Console Logging
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/util/log.hpp>
#include <iostream>

namespace gchat::log {

static bool g_debug = false;
static bool g_quiet = false;

void set_debug(bool on) { g_debug = on; }
bool debug_enabled() { return g_debug; }
void set_quiet(bool on) { g_quiet = on; }

void info(const std::string& msg) {
    if (g_quiet) return;
    std::cout << "[gchat] " << msg << "\n";
}

void warn(const std::string& msg) {
    if (g_quiet) return;
    std::cerr << "[warn] " << msg << "\n";
}

void error(const std::string& msg) {
    if (g_quiet) return;
    std::cerr << "[error] " << msg << "\n";
}

void debug(const std::string& msg) {
    if (g_quiet || !g_debug) return;
    std::cout << "[DEBUG] " << msg << "\n";
}

} // namespace gchat::log
